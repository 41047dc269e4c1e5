// =============================================================================
// rebalancer.cpp - Imbalance-driven position roll
// =============================================================================

#include "tickvault/rebalancer.hpp"
#include "tickvault/errors.hpp"
#include "tickvault/log.hpp"
#include "tickvault/positions.hpp"

#include <algorithm>

namespace tickvault {

namespace {

// Value of the rebalancer's live position, zero if its tick was liquidated
I128 close_rebalancer_position(ProtocolState& state, const ProtocolConfig& config,
                               const PositionId& pos_id, I128 price) {
    if (pos_id.tick == constants::NO_POSITION_TICK ||
        state.tick_version(pos_id.tick) != pos_id.tick_version) {
        return 0;
    }

    auto [position, penalty] = book::get_long_position(state, pos_id);
    I128 liq_price = book::effective_price_for_tick(pos_id.tick - penalty, book::current_multiplier(state));
    I128 value = pricing::position_value(position.total_expo, price, liq_price);
    value = std::clamp<I128>(value, 0, std::max<I128>(state.balance_long, 0));

    book::remove_amount_from_position(state, config, pos_id, position.amount, position.total_expo);
    state.balance_long -= value;
    state.balance_vault += value;
    return value;
}

} // namespace

std::optional<RebalancerAction> trigger_rebalancer(ProtocolState& state, const ProtocolConfig& config,
                                                   const Address& rebalancer, const RebalancerState& rebalancer_state,
                                                   I128 price, I128 remaining_collateral, IEventSink& events) {
    I128 long_expo = state.long_trading_expo();
    if (long_expo <= 0) {
        return std::nullopt;
    }

    I128 imbalance = pricing::imbalance_close_bps(state.balance_vault, long_expo);
    if (imbalance <= config.limits.rebalancer_close_bps) {
        return std::nullopt;
    }

    RebalancerAction action;
    action.close_imbalance_bps = imbalance;
    action.previous_position_value = close_rebalancer_position(state, config, rebalancer_state.position_id, price);

    I128 vault_without_previous = state.balance_vault - action.previous_position_value;
    if (remaining_collateral > 0) {
        action.bonus = mul_div(remaining_collateral, config.rebalancer_bonus_bps, constants::BPS_DIVISOR);
        action.bonus = std::min(action.bonus, std::max<I128>(vault_without_previous, 0));
    }

    I128 amount = action.previous_position_value + rebalancer_state.pending_assets + action.bonus;
    if (amount < config.min_long_position || amount <= 0) {
        action.bonus = 0;
        log::logger()->info("rebalancer: amount {} below minimum, previous value stays in the vault",
                            x18::to_decimal_string(amount));
        return action;
    }

    // Trading expo needed to reach the long imbalance target
    I128 vault_after = state.balance_vault - action.previous_position_value - action.bonus;
    I128 target_long_expo = mul_div(vault_after, constants::BPS_DIVISOR,
                                    constants::BPS_DIVISOR + config.limits.long_target_bps);
    I128 expo_to_fill = target_long_expo - state.long_trading_expo();
    if (expo_to_fill <= 0) {
        action.bonus = 0;
        log::logger()->info("rebalancer: no trading expo to fill");
        return action;
    }

    I128 max_leverage = config.max_leverage;
    if (rebalancer_state.max_leverage > 0) {
        max_leverage = std::min(max_leverage, rebalancer_state.max_leverage);
    }
    I128 leverage = mul_div(amount + expo_to_fill, X18_ONE, amount);
    leverage = std::clamp(leverage, config.min_leverage, std::max(max_leverage, config.min_leverage));

    I128 desired_liq_price = pricing::get_liquidation_price(price, leverage);
    auto [tick, penalty] = book::get_tick_from_desired_liq_price(state, config, desired_liq_price,
                                                                  config.liquidation_penalty);
    I128 liq_price_without_penalty = book::effective_price_for_tick(state, tick - penalty);
    if (liq_price_without_penalty >= price) {
        action.bonus = 0;
        return action;
    }
    I128 total_expo = pricing::calc_position_total_expo(amount, price, liq_price_without_penalty);

    Position position;
    position.validated = true;
    position.timestamp = state.last_update_timestamp;
    position.user = rebalancer;
    position.amount = amount;
    position.total_expo = total_expo;
    action.new_pos_id = book::save_new_position(state, config, tick, position, penalty);

    state.balance_vault -= action.previous_position_value + action.bonus;
    state.balance_long += amount;

    action.pending_assets_used = rebalancer_state.pending_assets;
    action.position_amount = amount;
    action.trading_expo_filled = total_expo - amount;

    events.on_rebalancer_triggered(amount, action.trading_expo_filled, action.new_pos_id,
                                   static_cast<int64_t>(imbalance));
    log::logger()->info("rebalancer: imbalance {} bps, new position at tick {} amount {} expo {}",
                        static_cast<int64_t>(imbalance), tick, x18::to_decimal_string(amount),
                        x18::to_decimal_string(total_expo));
    return action;
}

} // namespace tickvault
