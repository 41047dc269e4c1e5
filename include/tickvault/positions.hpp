#ifndef TICKVAULT_POSITIONS_HPP
#define TICKVAULT_POSITIONS_HPP

#include <utility>

#include "config.hpp"
#include "state.hpp"
#include "types.hpp"
#include "uint512.hpp"

namespace tickvault {

// =============================================================================
// Position Pricing (pure)
// =============================================================================

namespace pricing {

// total_expo * (price - liq_price) / price. Negative below the liquidation price.
I128 position_value(I128 total_expo, I128 current_price, I128 liq_price_without_penalty);

// amount * start_price / (start_price - liq_price)
// Throws ProtocolError(INVALID_LIQUIDATION_PRICE) if liq_price >= start_price
I128 calc_position_total_expo(I128 amount, I128 start_price, I128 liq_price);

// start_price * 1e18 / (start_price - liq_price)
I128 get_leverage(I128 start_price, I128 liq_price);

// start_price - start_price * 1e18 / leverage
I128 get_liquidation_price(I128 start_price, I128 leverage);

// (long_expo - vault_expo) * BPS / vault_expo. Throws EMPTY_VAULT if vault_expo <= 0.
I128 imbalance_open_bps(I128 vault_expo, I128 long_expo);

// (vault_expo - long_expo) * BPS / long_expo. Throws ZERO_TOTAL_EXPO if long_expo <= 0.
I128 imbalance_close_bps(I128 vault_expo, I128 long_expo);

} // namespace pricing

// =============================================================================
// Long Book
//
// Tick-indexed position store over ProtocolState. Prices labelled "effective"
// include the funding adjustment of the liquidation multiplier; the multiplier
// is taken from state.last_price and the current long trading expo unless one
// is passed explicitly.
// =============================================================================

namespace book {

// Multiplier for the committed balances and last price
U256 current_multiplier(const ProtocolState& state);

I128 effective_price_for_tick(const ProtocolState& state, int32_t tick);
I128 effective_price_for_tick(int32_t tick, const U256& multiplier);

// Highest usable tick whose effective price is <= price (clamped to the usable range)
int32_t effective_tick_for_price(const ProtocolState& state, const ProtocolConfig& config, I128 price);
int32_t effective_tick_for_price(I128 price, I128 asset_price, I128 long_trading_expo,
                                 const Uint512& accumulator, int32_t tick_spacing);

// Tick for a desired liquidation price (without penalty). Rounds down and adds
// the penalty; a populated tick keeps its own stored penalty.
// Returns {tick, liquidation_penalty}.
std::pair<int32_t, int32_t> get_tick_from_desired_liq_price(const ProtocolState& state,
                                                             const ProtocolConfig& config,
                                                             I128 desired_liq_price_without_penalty,
                                                             int32_t liquidation_penalty);

// Value of a whole tick at current_price
I128 tick_value(const ProtocolState& state, int32_t tick, I128 current_price, const U256& multiplier);

// Highest populated tick <= search_start, or the minimum usable tick
int32_t find_highest_populated_tick(const ProtocolState& state, const ProtocolConfig& config,
                                    int32_t search_start);

// Insert into the tick arena. Updates tick data, total expo, accumulator, bitmap
// and the highest populated tick. Balances are left to the caller.
PositionId save_new_position(ProtocolState& state, const ProtocolConfig& config, int32_t tick,
                             const Position& position, int32_t liquidation_penalty);

// Partial or full removal. A full removal (amount == position amount) frees the slot.
void remove_amount_from_position(ProtocolState& state, const ProtocolConfig& config,
                                 const PositionId& pos_id, I128 amount_to_remove,
                                 I128 total_expo_to_remove);

// Throws OUTDATED_TICK for a liquidated tick version, POSITION_NOT_FOUND for an empty slot.
// Returns {position, liquidation_penalty}.
std::pair<Position, int32_t> get_long_position(const ProtocolState& state, const PositionId& pos_id);

// Replaces the position's total expo (tick, book and accumulator follow) and
// marks it validated
void finalize_position(ProtocolState& state, const PositionId& pos_id, I128 new_total_expo);

// Value of a position at price using the current multiplier
I128 get_position_value(const ProtocolState& state, const PositionId& pos_id, I128 price);

} // namespace book

} // namespace tickvault

#endif // TICKVAULT_POSITIONS_HPP
