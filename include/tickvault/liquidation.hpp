#ifndef TICKVAULT_LIQUIDATION_HPP
#define TICKVAULT_LIQUIDATION_HPP

#include <cstdint>
#include <vector>

#include "config.hpp"
#include "events.hpp"
#include "state.hpp"
#include "types.hpp"

namespace tickvault {

// =============================================================================
// Liquidation Sweep
// =============================================================================

struct LiquidatedTick {
    int32_t tick;
    uint64_t old_version;
    LiqTickInfo info;
    I128 tick_value;            // collateral left (negative: bad debt)
};

struct LiquidationEffects {
    uint32_t liquidated_positions = 0;
    uint16_t liquidated_ticks = 0;
    I128 remaining_collateral = 0;
    I128 new_long_balance = 0;
    I128 new_vault_balance = 0;
    bool is_liquidation_pending = false;
    std::vector<LiquidatedTick> ticks;
};

// Clears every populated tick whose effective price (penalty included) is at
// or above current_price, highest first, stopping after `iterations` ticks (capped at MAX_LIQUIDATION_ITERATION).
// Each tick's remaining value moves from the long balance to the vault, with
// bad debt clamped onto the counterparty. The input balances are the unclamped
// ones from funding::apply_pnl_and_funding so the multiplier stays consistent. Tick arena, bitmap, total expo and
// accumulator are updated in `state`; the balances are returned, not written.
LiquidationEffects liquidate_positions(ProtocolState& state, const ProtocolConfig& config,
                                       I128 current_price, uint16_t iterations,
                                       I128 long_balance, I128 vault_balance, IEventSink& events);

} // namespace tickvault

#endif // TICKVAULT_LIQUIDATION_HPP
