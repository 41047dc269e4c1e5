#ifndef TICKVAULT_STATE_HPP
#define TICKVAULT_STATE_HPP

#include <map>
#include <optional>
#include <vector>

#include "pending_actions.hpp"
#include "tick_bitmap.hpp"
#include "types.hpp"
#include "uint512.hpp"

namespace tickvault {

// =============================================================================
// Tick Bucket
//
// Positions of one tick. `version` increments each time the tick is
// liquidated; removed positions leave an empty slot so indices stay stable.
// =============================================================================

struct TickBucket {
    uint64_t version = 0;
    TickData data;
    std::vector<std::optional<Position>> positions;
};

// =============================================================================
// Protocol State
//
// Everything a transition reads or writes. Copyable: transitions run on a
// draft copy which replaces the committed state only on success.
// =============================================================================

struct ProtocolState {
    bool initialized = false;

    // Balances (asset units, X18)
    I128 balance_long = 0;
    I128 balance_vault = 0;
    I128 pending_balance_vault = 0;   // deposits (+) / withdrawals (-) awaiting validation
    I128 total_expo = 0;

    // Funding
    I128 ema = 0;
    I128 last_funding_per_day = 0;
    I128 last_price = 0;
    uint64_t last_update_timestamp = 0;

    // Stable token
    I128 usdn_total_supply = 0;

    // Long book
    Uint512 liq_multiplier_accumulator;
    std::map<int32_t, TickBucket> ticks;
    TickBitmap bitmap;
    int32_t highest_populated_tick = constants::NO_POSITION_TICK;
    uint64_t total_long_positions = 0;

    PendingActionQueue pending_actions;

    I128 long_trading_expo() const { return total_expo - balance_long; }

    uint64_t tick_version(int32_t tick) const {
        auto it = ticks.find(tick);
        return it == ticks.end() ? 0 : it->second.version;
    }

    const TickData* tick_data(int32_t tick) const {
        auto it = ticks.find(tick);
        return it == ticks.end() ? nullptr : &it->second.data;
    }
};

} // namespace tickvault

#endif // TICKVAULT_STATE_HPP
