#ifndef TICKVAULT_LIQUIDATION_MULTIPLIER_HPP
#define TICKVAULT_LIQUIDATION_MULTIPLIER_HPP

#include "types.hpp"
#include "uint512.hpp"

namespace tickvault {

// =============================================================================
// Liquidation Multiplier
//
// The accumulator is sum(price(tick - penalty) * total_expo) over every live
// position. Relating it to the long trading expo at the current asset price
// gives a single multiplier that moves all liquidation prices together as
// funding and PnL shift the long balance.
//
//   multiplier      = asset_price * long_trading_expo * FIXED_PRECISION / accumulator
//   effective price = unadjusted * multiplier / FIXED_PRECISION
//   unadjusted      = effective * accumulator / (asset_price * long_trading_expo)
// =============================================================================

namespace multiplier {

// 1e38
constexpr U128 FIXED_PRECISION = static_cast<U128>(10000000000000000000ULL) *
                                 static_cast<U128>(10000000000000000000ULL);

// Returns FIXED_PRECISION when the accumulator is zero or long_trading_expo <= 0
U256 fixed_precision_multiplier(I128 asset_price, I128 long_trading_expo,
                                const Uint512& accumulator);

// Unadjusted tick price -> effective liquidation price
I128 adjust_price(I128 unadjusted_price, const U256& multiplier);

// Convenience overload computing the multiplier first
I128 adjust_price(I128 unadjusted_price, I128 asset_price, I128 long_trading_expo,
                  const Uint512& accumulator);

// Effective price -> unadjusted tick price
I128 unadjust_price(I128 price, I128 asset_price, I128 long_trading_expo,
                    const Uint512& accumulator);

// price(tick - penalty) * total_expo, the amount a tick (or position) adds
Uint512 accumulator_term(I128 unadjusted_price, I128 total_expo);

} // namespace multiplier

} // namespace tickvault

#endif // TICKVAULT_LIQUIDATION_MULTIPLIER_HPP
