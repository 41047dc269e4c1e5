#ifndef TICKVAULT_FUNDING_HPP
#define TICKVAULT_FUNDING_HPP

#include <cstdint>

#include "config.hpp"
#include "events.hpp"
#include "state.hpp"
#include "types.hpp"

namespace tickvault {

// =============================================================================
// Funding & PnL
//
// funding_per_day = sign(imbalance) * sf * 1e15 * imbalance^2 / max(long, vault)^2 + ema
// with imbalance = long_trading_expo - vault_trading_expo. Positive funding is
// paid by the long side to the vault.
// =============================================================================

namespace funding {

struct FundingResult {
    I128 funding = 0;           // cumulative over the elapsed time, 18 decimals
    I128 funding_per_day = 0;
    I128 old_long_expo = 0;
};

// Throws ProtocolError(TIMESTAMP_TOO_OLD) when timestamp < last_update_timestamp
FundingResult compute(const ProtocolState& state, const ProtocolConfig& config, uint64_t timestamp);

// Asset amount moving from long to vault: funding * old_long_expo / 1e18
I128 funding_asset(const FundingResult& result);

I128 updated_ema(I128 ema, I128 funding_per_day, uint64_t elapsed, uint64_t ema_period);

// total_expo - (total_expo - balance_long) * old_price / new_price
I128 long_asset_available(I128 total_expo, I128 balance_long, I128 new_price, I128 old_price);

// balance_vault + balance_long - long_asset_available(...), floored at zero
I128 vault_asset_available(I128 total_expo, I128 balance_vault, I128 balance_long, I128 new_price,
                           I128 old_price);

// Long balance after PnL and funding, before bad-debt clamping
I128 long_asset_available_with_funding(const ProtocolState& state, const ProtocolConfig& config,
                                       I128 price, uint64_t timestamp);

struct Balances {
    I128 balance_long = 0;
    I128 balance_vault = 0;
};

// Moves any negative side's shortfall onto the other side; the sum is preserved
Balances clamp_bad_debt(I128 balance_long, I128 balance_vault);

// Balances before bad-debt clamping: one side may be negative. The state
// itself always holds the clamped figures.
struct ApplyResult {
    bool price_recent = false;
    I128 balance_long = 0;
    I128 balance_vault = 0;
};

// Brings balances, ema and last price up to `timestamp`. A timestamp not after
// the last update leaves the state untouched and reports price_recent = false.
ApplyResult apply_pnl_and_funding(ProtocolState& state, const ProtocolConfig& config, I128 price,
                                  uint64_t timestamp, IEventSink& events);

} // namespace funding

} // namespace tickvault

#endif // TICKVAULT_FUNDING_HPP
