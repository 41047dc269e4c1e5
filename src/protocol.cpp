// =============================================================================
// protocol.cpp - Entry points and atomic transitions
// =============================================================================

#include "tickvault/protocol.hpp"
#include "tickvault/errors.hpp"
#include "tickvault/funding.hpp"
#include "tickvault/liquidation_multiplier.hpp"
#include "tickvault/log.hpp"
#include "tickvault/positions.hpp"
#include "tickvault/tick_bitmap.hpp"
#include "tickvault/tick_math.hpp"

#include <algorithm>
#include <mutex>
#include <type_traits>

#include <fmt/format.h>

namespace tickvault {

// Draft of one transition
struct Protocol::Transition {
    ProtocolState state;
    Settlement settlement;
    EventBuffer events;
    I128 unspent_value = 0;
    std::optional<std::pair<Address, RebalancerState>> rebalancer;   // read before locking
    std::optional<std::pair<PositionId, I128>> rebalancer_update;
};

namespace {

std::string describe(const PositionId& pos_id) {
    return fmt::format("({}, v{}, #{})", pos_id.tick, pos_id.tick_version, pos_id.index);
}

I128 usdn_to_mint(I128 amount, I128 vault_balance, I128 usdn_supply, I128 price) {
    if (usdn_supply <= 0 || vault_balance <= 0) {
        return mul_div(amount, price, X18_ONE);
    }
    return mul_div(amount, usdn_supply, vault_balance);
}

void require_addresses(const Address& to, const Address& validator) {
    if (addresses::is_zero(to)) {
        throw ProtocolError(Error::INVALID_ADDRESS_TO);
    }
    if (addresses::is_zero(validator)) {
        throw ProtocolError(Error::INVALID_ADDRESS_VALIDATOR);
    }
}

} // namespace

// =============================================================================
// Construction
// =============================================================================

Protocol::Protocol(ProtocolConfig config, IPriceOracle& oracle, IAssetCustody& custody, const Address& admin)
    : config_(std::move(config))
    , oracle_(oracle)
    , custody_(custody)
    , admin_(admin) {
    config_.validate();
    log::set_level(config_.log_level);

    state_.bitmap = TickBitmap(bitmap_size(config_.tick_spacing));
    state_.highest_populated_tick = tick_math::min_usable_tick(config_.tick_spacing);
}

void Protocol::set_event_sink(IEventSink* sink) {
    std::unique_lock lock(mutex_);
    sink_ = sink;
}

void Protocol::set_rebalancer(IRebalancer* rebalancer) {
    std::unique_lock lock(mutex_);
    rebalancer_ = rebalancer;
}

void Protocol::set_config(const CallContext& ctx, ProtocolConfig config) {
    std::unique_lock lock(mutex_);
    if (ctx.sender != admin_) {
        throw ProtocolError(Error::UNAUTHORIZED, "set_config is admin only", {.user = ctx.sender});
    }
    config.validate();

    if (config.tick_spacing != config_.tick_spacing) {
        if (state_.initialized) {
            throw ProtocolError(Error::INVALID_CONFIG, "tick_spacing cannot change after initialization");
        }
        state_.bitmap = TickBitmap(bitmap_size(config.tick_spacing));
        state_.highest_populated_tick = tick_math::min_usable_tick(config.tick_spacing);
    }

    config_ = std::move(config);
    log::set_level(config_.log_level);
    log::logger()->info("configuration updated");
}

// =============================================================================
// Transition Machinery
// =============================================================================

template <typename Fn>
auto Protocol::transact(const CallContext& ctx, const char* name, Fn&& fn) {
    // The rebalancer may read the protocol back, so it is queried without the engine lock held
    std::optional<std::pair<Address, RebalancerState>> rebalancer_view;
    IRebalancer* registered = nullptr;
    {
        std::shared_lock peek(mutex_);
        registered = rebalancer_;
    }
    if (registered != nullptr) {
        rebalancer_view = std::make_pair(registered->address(), registered->state());
    }

    std::unique_lock lock(mutex_);
    log::logger()->debug("{}: sender={} timestamp={} value={}", name, addresses::to_hex(ctx.sender),
                         ctx.timestamp, x18::to_decimal_string(ctx.value));

    Transition tx{state_};
    tx.rebalancer = std::move(rebalancer_view);
    tx.settlement.add(TransferKind::ETHER_IN, ctx.sender, ctx.value);
    tx.unspent_value = ctx.value;

    std::invoke_result_t<Fn&, Transition&> result{};
    try {
        result = fn(tx);
        tx.settlement.add(TransferKind::ETHER_OUT, ctx.sender, tx.unspent_value);
        custody_.settle(tx.settlement);
    } catch (const ProtocolError& e) {
        log::logger()->warn("{} reverted: {}", name, e.what());
        throw;
    }

    state_ = std::move(tx.state);
    IEventSink& sink = sink_ != nullptr ? *sink_ : null_sink_;
    IRebalancer* rebalancer = rebalancer_;
    lock.unlock();

    tx.events.replay(sink);
    if (tx.rebalancer_update && rebalancer != nullptr) {
        rebalancer->update_position(tx.rebalancer_update->first, tx.rebalancer_update->second);
    }
    return result;
}

LiquidationEffects Protocol::apply_pnl_and_liquidate(Transition& tx, const PriceInfo& price, uint16_t iterations) {
    auto applied = funding::apply_pnl_and_funding(tx.state, config_, price.neutral_price, price.timestamp,
                                                  tx.events);
    if (!applied.price_recent) {
        LiquidationEffects none;
        none.new_long_balance = tx.state.balance_long;
        none.new_vault_balance = tx.state.balance_vault;
        return none;
    }

    LiquidationEffects effects = liquidate_positions(tx.state, config_, price.neutral_price, iterations,
                                                     applied.balance_long, applied.balance_vault, tx.events);
    tx.state.balance_long = effects.new_long_balance;
    tx.state.balance_vault = effects.new_vault_balance;

    if (effects.is_liquidation_pending) {
        log::logger()->info("liquidations still pending after {} ticks", effects.liquidated_ticks);
    }

    if (effects.liquidated_ticks > 0 && !effects.is_liquidation_pending && tx.rebalancer) {
        const auto& [rebalancer, rebalancer_state] = *tx.rebalancer;
        auto action = trigger_rebalancer(tx.state, config_, rebalancer, rebalancer_state,
                                         price.neutral_price, effects.remaining_collateral, tx.events);
        if (action) {
            tx.settlement.add(TransferKind::ASSET_IN, rebalancer, action->pending_assets_used);
            tx.rebalancer_update = std::make_pair(action->new_pos_id, action->previous_position_value);
        }
    }
    return effects;
}

void Protocol::require_initialized(const Transition& tx) const {
    if (!tx.state.initialized) {
        throw ProtocolError(Error::NOT_INITIALIZED);
    }
}

void Protocol::require_security_deposit(const CallContext& ctx) const {
    if (ctx.value != config_.security_deposit_value) {
        throw ProtocolError(Error::SECURITY_DEPOSIT_VALUE,
                            fmt::format("expected {}, got {}",
                                        x18::to_decimal_string(config_.security_deposit_value),
                                        x18::to_decimal_string(ctx.value)));
    }
}

void Protocol::require_recent(const Transition& tx, uint64_t timestamp) const {
    if (timestamp < tx.state.last_update_timestamp) {
        throw ProtocolError(Error::TIMESTAMP_TOO_OLD, "", {.timestamp = timestamp});
    }
}

void Protocol::check_leverage(I128 start_price, I128 liq_price_without_penalty) const {
    if (liq_price_without_penalty >= start_price) {
        throw ProtocolError(Error::INVALID_LIQUIDATION_PRICE, "liquidation price not below start price",
                            {.price = liq_price_without_penalty});
    }
    I128 max_liq_price = mul_div(start_price, constants::BPS_DIVISOR - config_.safety_margin_bps,
                                 constants::BPS_DIVISOR);
    if (liq_price_without_penalty > max_liq_price) {
        throw ProtocolError(Error::INVALID_LIQUIDATION_PRICE, "liquidation price inside the safety margin",
                            {.price = liq_price_without_penalty});
    }

    I128 leverage = pricing::get_leverage(start_price, liq_price_without_penalty);
    if (leverage < config_.min_leverage) {
        throw ProtocolError(Error::LEVERAGE_TOO_LOW, x18::to_decimal_string(leverage));
    }
    if (leverage > config_.max_leverage) {
        throw ProtocolError(Error::LEVERAGE_TOO_HIGH, x18::to_decimal_string(leverage));
    }
}

// =============================================================================
// Imbalance Limits
// =============================================================================

void Protocol::check_imbalance_deposit(const ProtocolState& state, I128 deposit) const {
    if (config_.limits.deposit_bps == 0) return;
    I128 vault_expo = state.balance_vault + state.pending_balance_vault + deposit;
    I128 imbalance = pricing::imbalance_close_bps(vault_expo, state.long_trading_expo());
    if (imbalance > config_.limits.deposit_bps) {
        throw ProtocolError(Error::IMBALANCE_LIMIT_REACHED, fmt::format("deposit imbalance {} bps",
                                                                        static_cast<int64_t>(imbalance)));
    }
}

void Protocol::check_imbalance_withdrawal(const ProtocolState& state, I128 withdrawal) const {
    if (config_.limits.withdrawal_bps == 0) return;
    I128 vault_expo = state.balance_vault + state.pending_balance_vault - withdrawal;
    if (vault_expo <= 0) {
        throw ProtocolError(Error::EMPTY_VAULT, "withdrawal would empty the vault");
    }
    I128 imbalance = pricing::imbalance_open_bps(vault_expo, state.long_trading_expo());
    if (imbalance > config_.limits.withdrawal_bps) {
        throw ProtocolError(Error::IMBALANCE_LIMIT_REACHED, fmt::format("withdrawal imbalance {} bps",
                                                                        static_cast<int64_t>(imbalance)));
    }
}

void Protocol::check_imbalance_open(const ProtocolState& state, I128 amount, I128 total_expo) const {
    if (config_.limits.open_bps == 0) return;
    I128 vault_expo = state.balance_vault + state.pending_balance_vault;
    I128 long_expo = state.long_trading_expo() + total_expo - amount;
    I128 imbalance = pricing::imbalance_open_bps(vault_expo, long_expo);
    if (imbalance > config_.limits.open_bps) {
        throw ProtocolError(Error::IMBALANCE_LIMIT_REACHED, fmt::format("open imbalance {} bps",
                                                                        static_cast<int64_t>(imbalance)));
    }
}

void Protocol::check_imbalance_close(const ProtocolState& state, I128 total_expo, I128 value) const {
    if (config_.limits.close_bps == 0) return;
    I128 vault_expo = state.balance_vault + state.pending_balance_vault;
    I128 long_expo = (state.total_expo - total_expo) - (state.balance_long - value);
    I128 imbalance = pricing::imbalance_close_bps(vault_expo, long_expo);
    if (imbalance > config_.limits.close_bps) {
        throw ProtocolError(Error::IMBALANCE_LIMIT_REACHED, fmt::format("close imbalance {} bps",
                                                                        static_cast<int64_t>(imbalance)));
    }
}

// =============================================================================
// Pending Action Helpers
// =============================================================================

void Protocol::add_pending_action(Transition& tx, const PendingAction& action) {
    auto [existing, raw_index] = tx.state.pending_actions.get(action.validator);
    if (raw_index != 0) {
        const auto* open = std::get_if<OpenPositionData>(&existing.data);
        if (open != nullptr && tx.state.tick_version(open->pos_id.tick) != open->pos_id.tick_version) {
            tx.state.pending_actions.clear(raw_index);
            tx.settlement.add(TransferKind::ETHER_OUT, action.user, existing.security_deposit_value);
            tx.events.on_security_deposit_refunded(existing.validator, action.user,
                                                   existing.security_deposit_value);
            tx.events.on_stale_pending_action_removed(existing.validator, open->pos_id);
            log::logger()->info("removed stale open action of {} at {}", addresses::to_hex(existing.validator),
                                describe(open->pos_id));
        }
    }
    tx.state.pending_actions.add(action);
}

void Protocol::refund_security_deposit(Transition& tx, const PendingAction& action, const Address& receiver) {
    tx.settlement.add(TransferKind::ETHER_OUT, receiver, action.security_deposit_value);
    tx.events.on_security_deposit_refunded(action.validator, receiver, action.security_deposit_value);
}

bool Protocol::validate_own(Transition& tx, const CallContext& ctx, ProtocolAction expected,
                            const PriceData& price_data) {
    require_initialized(tx);

    auto [action, raw_index] = tx.state.pending_actions.get_or_throw(ctx.sender);
    if (action.action() != expected) {
        throw ProtocolError(Error::INVALID_PENDING_ACTION,
                            fmt::format("pending action is {}, not {}", to_string(action.action()),
                                        to_string(expected)),
                            {.user = ctx.sender});
    }

    uint64_t price_timestamp = action.timestamp + config_.validation_delay;
    if (ctx.timestamp < price_timestamp) {
        throw ProtocolError(Error::VALIDATION_TOO_EARLY, fmt::format("validation opens at {}", price_timestamp),
                            {.timestamp = ctx.timestamp});
    }

    PriceInfo price = oracle_.get_price(expected, price_timestamp, price_data);
    LiquidationEffects effects = apply_pnl_and_liquidate(tx, price, config_.liquidation_iterations);
    if (effects.is_liquidation_pending) {
        return false;
    }

    execute_pending(tx, action, raw_index, price.price, ctx.sender);
    return true;
}

void Protocol::execute_pending(Transition& tx, const PendingAction& action, uint64_t raw_index,
                               I128 price, const Address& deposit_receiver) {
    if (const auto* deposit = std::get_if<DepositData>(&action.data)) {
        execute_deposit(tx, action, *deposit, price);
    } else if (const auto* withdrawal = std::get_if<WithdrawalData>(&action.data)) {
        execute_withdrawal(tx, action, *withdrawal, price);
    } else if (const auto* open = std::get_if<OpenPositionData>(&action.data)) {
        execute_open(tx, action, *open, price);
    } else if (const auto* close = std::get_if<ClosePositionData>(&action.data)) {
        execute_close(tx, action, *close, price);
    } else {
        throw ProtocolError(Error::INVALID_PENDING_ACTION, "empty pending action");
    }

    tx.state.pending_actions.clear(raw_index);
    refund_security_deposit(tx, action, deposit_receiver);
}

// =============================================================================
// Initialize
// =============================================================================

void Protocol::initialize(const CallContext& ctx, I128 deposit_amount, I128 long_amount,
                          I128 desired_liq_price, const PriceData& price_data) {
    transact(ctx, "initialize", [&](Transition& tx) {
        if (tx.state.initialized) {
            throw ProtocolError(Error::ALREADY_INITIALIZED);
        }
        if (deposit_amount <= 0) {
            throw ProtocolError(Error::ZERO_AMOUNT, "initial deposit");
        }
        if (long_amount < config_.min_long_position || long_amount <= 0) {
            throw ProtocolError(Error::LONG_POSITION_TOO_SMALL, x18::to_decimal_string(long_amount));
        }

        PriceInfo price = oracle_.get_price(ProtocolAction::INITIALIZE, ctx.timestamp, price_data);

        ProtocolState& s = tx.state;
        s.initialized = true;
        s.last_price = price.neutral_price;
        s.last_update_timestamp = ctx.timestamp;
        s.ema = config_.initial_ema;
        s.last_funding_per_day = config_.initial_ema;

        // Vault side
        I128 minted = usdn_to_mint(deposit_amount, 0, 0, price.price);
        if (minted <= 0) {
            throw ProtocolError(Error::DEPOSIT_TOO_SMALL);
        }
        s.balance_vault = deposit_amount;
        s.usdn_total_supply = minted;

        // Long side
        auto [tick, penalty] = book::get_tick_from_desired_liq_price(s, config_, desired_liq_price,
                                                                      config_.liquidation_penalty);
        I128 liq_price = book::effective_price_for_tick(s, tick - penalty);
        check_leverage(price.price, liq_price);
        I128 total_expo = pricing::calc_position_total_expo(long_amount, price.price, liq_price);

        Position position;
        position.validated = true;
        position.timestamp = ctx.timestamp;
        position.user = ctx.sender;
        position.amount = long_amount;
        position.total_expo = total_expo;
        PositionId pos_id = book::save_new_position(s, config_, tick, position, penalty);
        s.balance_long = long_amount;

        tx.settlement.add(TransferKind::ASSET_IN, ctx.sender, deposit_amount + long_amount);
        tx.settlement.add(TransferKind::USDN_MINT, ctx.sender, minted);

        tx.events.on_validated_deposit(ctx.sender, ctx.sender, deposit_amount, minted, ctx.timestamp);
        tx.events.on_validated_open_position(ctx.sender, ctx.sender, total_expo, price.price, pos_id);
        log::logger()->info("initialized: vault {} long {} at price {}, position {}",
                            x18::to_decimal_string(deposit_amount), x18::to_decimal_string(long_amount),
                            x18::to_decimal_string(price.price), describe(pos_id));
        return true;
    });
}

// =============================================================================
// Deposit
// =============================================================================

bool Protocol::initiate_deposit(const CallContext& ctx, I128 amount, const Address& to,
                                const Address& validator, const PriceData& price_data) {
    return transact(ctx, "initiate_deposit", [&](Transition& tx) {
        require_initialized(tx);
        require_addresses(to, validator);
        if (amount <= 0) {
            throw ProtocolError(Error::ZERO_AMOUNT, "deposit");
        }
        require_security_deposit(ctx);
        require_recent(tx, ctx.timestamp);

        PriceInfo price = oracle_.get_price(ProtocolAction::INITIATE_DEPOSIT, ctx.timestamp, price_data);
        if (apply_pnl_and_liquidate(tx, price, config_.liquidation_iterations).is_liquidation_pending) {
            return false;
        }

        ProtocolState& s = tx.state;
        check_imbalance_deposit(s, amount);

        I128 vault_available = funding::vault_asset_available(s.total_expo, s.balance_vault, s.balance_long,
                                                              price.price, s.last_price);
        if (usdn_to_mint(amount, vault_available, s.usdn_total_supply, price.price) <= 0) {
            throw ProtocolError(Error::DEPOSIT_TOO_SMALL, x18::to_decimal_string(amount));
        }

        PendingAction action;
        action.validator = validator;
        action.to = to;
        action.user = ctx.sender;
        action.timestamp = ctx.timestamp;
        action.security_deposit_value = config_.security_deposit_value;
        action.data = DepositData{amount, VaultSnapshot{s.last_price, s.total_expo, s.balance_vault,
                                                        s.balance_long, s.usdn_total_supply}};
        add_pending_action(tx, action);

        s.pending_balance_vault += amount;
        tx.settlement.add(TransferKind::ASSET_IN, ctx.sender, amount);
        tx.unspent_value -= config_.security_deposit_value;

        tx.events.on_initiated_deposit(to, validator, amount, ctx.timestamp);
        return true;
    });
}

bool Protocol::validate_deposit(const CallContext& ctx, const PriceData& price_data) {
    return transact(ctx, "validate_deposit", [&](Transition& tx) {
        return validate_own(tx, ctx, ProtocolAction::VALIDATE_DEPOSIT, price_data);
    });
}

void Protocol::execute_deposit(Transition& tx, const PendingAction& action, const DepositData& data, I128 price) {
    const VaultSnapshot& snap = data.snapshot;
    I128 used_price = std::min(price, snap.asset_price);
    I128 available = funding::vault_asset_available(snap.total_expo, snap.balance_vault, snap.balance_long,
                                                    used_price, snap.asset_price);
    I128 minted = usdn_to_mint(data.amount, available, snap.usdn_total_supply, used_price);

    ProtocolState& s = tx.state;
    s.pending_balance_vault -= data.amount;
    s.balance_vault += data.amount;
    s.usdn_total_supply += minted;

    tx.settlement.add(TransferKind::USDN_MINT, action.to, minted);
    tx.events.on_validated_deposit(action.to, action.validator, data.amount, minted, action.timestamp);
}

// =============================================================================
// Withdrawal
// =============================================================================

bool Protocol::initiate_withdrawal(const CallContext& ctx, I128 usdn_amount, const Address& to,
                                   const Address& validator, const PriceData& price_data) {
    return transact(ctx, "initiate_withdrawal", [&](Transition& tx) {
        require_initialized(tx);
        require_addresses(to, validator);
        if (usdn_amount <= 0) {
            throw ProtocolError(Error::ZERO_AMOUNT, "withdrawal");
        }
        require_security_deposit(ctx);
        require_recent(tx, ctx.timestamp);

        PriceInfo price = oracle_.get_price(ProtocolAction::INITIATE_WITHDRAWAL, ctx.timestamp, price_data);
        if (apply_pnl_and_liquidate(tx, price, config_.liquidation_iterations).is_liquidation_pending) {
            return false;
        }

        ProtocolState& s = tx.state;
        if (s.usdn_total_supply <= 0) {
            throw ProtocolError(Error::EMPTY_VAULT, "no stable token outstanding");
        }
        I128 vault_available = funding::vault_asset_available(s.total_expo, s.balance_vault, s.balance_long,
                                                              price.price, s.last_price);
        I128 expected_assets = mul_div(usdn_amount, vault_available, s.usdn_total_supply);
        check_imbalance_withdrawal(s, expected_assets);

        PendingAction action;
        action.validator = validator;
        action.to = to;
        action.user = ctx.sender;
        action.timestamp = ctx.timestamp;
        action.security_deposit_value = config_.security_deposit_value;
        action.data = WithdrawalData{usdn_amount, expected_assets,
                                     VaultSnapshot{s.last_price, s.total_expo, s.balance_vault,
                                                   s.balance_long, s.usdn_total_supply}};
        add_pending_action(tx, action);

        s.pending_balance_vault -= expected_assets;
        tx.settlement.add(TransferKind::USDN_LOCK, ctx.sender, usdn_amount);
        tx.unspent_value -= config_.security_deposit_value;

        tx.events.on_initiated_withdrawal(to, validator, usdn_amount, ctx.timestamp);
        return true;
    });
}

bool Protocol::validate_withdrawal(const CallContext& ctx, const PriceData& price_data) {
    return transact(ctx, "validate_withdrawal", [&](Transition& tx) {
        return validate_own(tx, ctx, ProtocolAction::VALIDATE_WITHDRAWAL, price_data);
    });
}

void Protocol::execute_withdrawal(Transition& tx, const PendingAction& action, const WithdrawalData& data,
                                  I128 price) {
    const VaultSnapshot& snap = data.snapshot;
    I128 used_price = std::max(price, snap.asset_price);
    I128 available = funding::vault_asset_available(snap.total_expo, snap.balance_vault, snap.balance_long,
                                                    used_price, snap.asset_price);
    I128 assets = mul_div(data.usdn_amount, available, snap.usdn_total_supply);

    ProtocolState& s = tx.state;
    s.pending_balance_vault += data.expected_assets;
    assets = std::clamp<I128>(assets, 0, std::max<I128>(s.balance_vault, 0));
    s.balance_vault -= assets;
    s.usdn_total_supply -= data.usdn_amount;

    tx.settlement.add(TransferKind::USDN_BURN, action.user, data.usdn_amount);
    tx.settlement.add(TransferKind::ASSET_OUT, action.to, assets);
    tx.events.on_validated_withdrawal(action.to, action.validator, assets, data.usdn_amount, action.timestamp);
}

// =============================================================================
// Open Position
// =============================================================================

InitiateOpenResult Protocol::initiate_open_position(const CallContext& ctx, I128 amount, I128 desired_liq_price,
                                                    const Address& to, const Address& validator,
                                                    const PriceData& price_data) {
    return transact(ctx, "initiate_open_position", [&](Transition& tx) {
        require_initialized(tx);
        require_addresses(to, validator);
        if (amount <= 0) {
            throw ProtocolError(Error::ZERO_AMOUNT, "open position");
        }
        if (amount < config_.min_long_position) {
            throw ProtocolError(Error::LONG_POSITION_TOO_SMALL, x18::to_decimal_string(amount));
        }
        require_security_deposit(ctx);
        require_recent(tx, ctx.timestamp);

        PriceInfo price = oracle_.get_price(ProtocolAction::INITIATE_OPEN_POSITION, ctx.timestamp, price_data);
        if (apply_pnl_and_liquidate(tx, price, config_.liquidation_iterations).is_liquidation_pending) {
            return InitiateOpenResult{};
        }

        ProtocolState& s = tx.state;
        auto [tick, penalty] = book::get_tick_from_desired_liq_price(s, config_, desired_liq_price,
                                                                      config_.liquidation_penalty);
        I128 liq_price = book::effective_price_for_tick(s, tick - penalty);
        check_leverage(price.price, liq_price);
        I128 total_expo = pricing::calc_position_total_expo(amount, price.price, liq_price);
        check_imbalance_open(s, amount, total_expo);

        Position position;
        position.validated = false;
        position.timestamp = ctx.timestamp;
        position.user = to;
        position.amount = amount;
        position.total_expo = total_expo;
        PositionId pos_id = book::save_new_position(s, config_, tick, position, penalty);
        s.balance_long += amount;

        PendingAction action;
        action.validator = validator;
        action.to = to;
        action.user = ctx.sender;
        action.timestamp = ctx.timestamp;
        action.security_deposit_value = config_.security_deposit_value;
        action.data = OpenPositionData{pos_id, amount, price.price};
        add_pending_action(tx, action);

        tx.settlement.add(TransferKind::ASSET_IN, ctx.sender, amount);
        tx.unspent_value -= config_.security_deposit_value;

        tx.events.on_initiated_open_position(to, validator, ctx.timestamp, total_expo, amount, price.price, pos_id);
        return InitiateOpenResult{true, pos_id};
    });
}

bool Protocol::validate_open_position(const CallContext& ctx, const PriceData& price_data) {
    return transact(ctx, "validate_open_position", [&](Transition& tx) {
        return validate_own(tx, ctx, ProtocolAction::VALIDATE_OPEN_POSITION, price_data);
    });
}

void Protocol::execute_open(Transition& tx, const PendingAction& action, const OpenPositionData& data, I128 price) {
    ProtocolState& s = tx.state;
    if (s.tick_version(data.pos_id.tick) != data.pos_id.tick_version) {
        // Liquidated before validation: only the security deposit is left to return
        log::logger()->info("open position {} was liquidated before validation", describe(data.pos_id));
        return;
    }

    auto [position, penalty] = book::get_long_position(s, data.pos_id);
    I128 liq_price = book::effective_price_for_tick(s, data.pos_id.tick - penalty);

    bool too_risky = liq_price >= price || pricing::get_leverage(price, liq_price) > config_.max_leverage;
    if (!too_risky) {
        I128 total_expo = pricing::calc_position_total_expo(position.amount, price, liq_price);
        book::finalize_position(s, data.pos_id, total_expo);
        tx.events.on_validated_open_position(position.user, action.validator, total_expo, price, data.pos_id);
        return;
    }

    // Re-priced leverage is above the maximum: move to the tick matching max leverage
    book::remove_amount_from_position(s, config_, data.pos_id, position.amount, position.total_expo);

    I128 desired = pricing::get_liquidation_price(price, config_.max_leverage);
    auto [tick, new_penalty] = book::get_tick_from_desired_liq_price(s, config_, desired,
                                                                      config_.liquidation_penalty);
    I128 new_liq_price = book::effective_price_for_tick(s, tick - new_penalty);
    I128 total_expo = pricing::calc_position_total_expo(position.amount, price, new_liq_price);

    position.validated = true;
    position.total_expo = total_expo;
    PositionId new_id = book::save_new_position(s, config_, tick, position, new_penalty);

    tx.events.on_liquidation_price_updated(data.pos_id, new_id);
    tx.events.on_validated_open_position(position.user, action.validator, total_expo, price, new_id);
    log::logger()->info("open position {} moved to {} at validation", describe(data.pos_id), describe(new_id));
}

// =============================================================================
// Close Position
// =============================================================================

bool Protocol::initiate_close_position(const CallContext& ctx, const PositionId& pos_id, I128 amount_to_close,
                                      const Address& to, const Address& validator,
                                      const PriceData& price_data) {
    return transact(ctx, "initiate_close_position", [&](Transition& tx) {
        require_initialized(tx);
        require_addresses(to, validator);
        if (amount_to_close <= 0) {
            throw ProtocolError(Error::ZERO_AMOUNT, "close amount");
        }
        require_security_deposit(ctx);
        require_recent(tx, ctx.timestamp);

        PriceInfo price = oracle_.get_price(ProtocolAction::INITIATE_CLOSE_POSITION, ctx.timestamp, price_data);
        if (apply_pnl_and_liquidate(tx, price, config_.liquidation_iterations).is_liquidation_pending) {
            return false;
        }

        ProtocolState& s = tx.state;
        auto [position, penalty] = book::get_long_position(s, pos_id);
        if (position.user != ctx.sender) {
            throw ProtocolError(Error::UNAUTHORIZED, "only the owner can close", {.user = ctx.sender});
        }
        if (!position.validated) {
            throw ProtocolError(Error::POSITION_NOT_VALIDATED, describe(pos_id));
        }
        if (amount_to_close > position.amount) {
            throw ProtocolError(Error::AMOUNT_TO_CLOSE_TOO_HIGH, x18::to_decimal_string(amount_to_close));
        }
        I128 remaining = position.amount - amount_to_close;
        if (remaining > 0 && remaining < config_.min_long_position) {
            throw ProtocolError(Error::LONG_POSITION_TOO_SMALL, "remaining " + x18::to_decimal_string(remaining));
        }

        I128 expo_to_close = remaining == 0 ? position.total_expo
                                            : mul_div(position.total_expo, amount_to_close, position.amount);
        U256 close_multiplier = book::current_multiplier(s);
        I128 liq_price = book::effective_price_for_tick(pos_id.tick - penalty, close_multiplier);
        I128 value = pricing::position_value(expo_to_close, price.price, liq_price);
        value = std::clamp<I128>(value, 0, std::max<I128>(s.balance_long, 0));

        check_imbalance_close(s, expo_to_close, value);

        book::remove_amount_from_position(s, config_, pos_id, amount_to_close, expo_to_close);
        s.balance_long -= value;

        PendingAction action;
        action.validator = validator;
        action.to = to;
        action.user = ctx.sender;
        action.timestamp = ctx.timestamp;
        action.security_deposit_value = config_.security_deposit_value;
        action.data = ClosePositionData{pos_id, penalty, amount_to_close, expo_to_close, close_multiplier, value};
        add_pending_action(tx, action);

        tx.unspent_value -= config_.security_deposit_value;
        tx.events.on_initiated_close_position(ctx.sender, validator, to, pos_id, position.amount, amount_to_close,
                                              position.total_expo - expo_to_close);
        return true;
    });
}

bool Protocol::validate_close_position(const CallContext& ctx, const PriceData& price_data) {
    return transact(ctx, "validate_close_position", [&](Transition& tx) {
        return validate_own(tx, ctx, ProtocolAction::VALIDATE_CLOSE_POSITION, price_data);
    });
}

void Protocol::execute_close(Transition& tx, const PendingAction& action, const ClosePositionData& data,
                             I128 price) {
    ProtocolState& s = tx.state;
    I128 liq_price = book::effective_price_for_tick(data.pos_id.tick - data.liquidation_penalty,
                                                    data.close_multiplier);
    I128 value = pricing::position_value(data.total_expo, price, liq_price);

    if (value <= 0) {
        // Underwater at validation: the value taken at initiation belongs to the vault
        s.balance_vault += data.temp_transfer;
        tx.events.on_liquidated_position(action.user, data.pos_id, price, liq_price);
        log::logger()->info("closed position {} liquidated at validation", describe(data.pos_id));
        return;
    }

    I128 assets = std::min(value, s.balance_long + data.temp_transfer);
    s.balance_long += data.temp_transfer - assets;

    tx.settlement.add(TransferKind::ASSET_OUT, action.to, assets);
    tx.events.on_validated_close_position(action.user, action.to, data.pos_id, assets, assets - data.amount);
}

// =============================================================================
// Liquidation & Actionable Validation
// =============================================================================

std::vector<LiquidatedTick> Protocol::liquidate(const CallContext& ctx, const PriceData& price_data,
                                                uint16_t iterations) {
    return transact(ctx, "liquidate", [&](Transition& tx) {
        require_initialized(tx);
        require_recent(tx, ctx.timestamp);

        PriceInfo price = oracle_.get_price(ProtocolAction::LIQUIDATION, ctx.timestamp, price_data);
        return apply_pnl_and_liquidate(tx, price, iterations).ticks;
    });
}

size_t Protocol::validate_actionable_pending_actions(const CallContext& ctx, size_t max_validations) {
    return transact(ctx, "validate_actionable_pending_actions", [&](Transition& tx) {
        require_initialized(tx);

        auto actionable = tx.state.pending_actions.get_actionable(ctx.sender, ctx.timestamp,
                                                                  config_.low_latency_validator_deadline);
        size_t validated = 0;
        for (const auto& [action, raw_index] : actionable) {
            if (validated >= max_validations) break;

            uint64_t price_timestamp = action.timestamp + config_.validation_delay;
            PriceInfo price = oracle_.get_price(action.action(), price_timestamp, PriceData{});
            if (apply_pnl_and_liquidate(tx, price, config_.liquidation_iterations).is_liquidation_pending) {
                break;
            }
            execute_pending(tx, action, raw_index, price.price, ctx.sender);
            ++validated;
        }
        return validated;
    });
}

// =============================================================================
// Admin Recovery
// =============================================================================

void Protocol::remove_blocked_pending_action(const CallContext& ctx, const Address& validator,
                                             const Address& to, bool cleanup) {
    transact(ctx, "remove_blocked_pending_action", [&](Transition& tx) {
        if (ctx.sender != admin_) {
            throw ProtocolError(Error::UNAUTHORIZED, "admin only", {.user = ctx.sender});
        }
        if (addresses::is_zero(to)) {
            throw ProtocolError(Error::INVALID_ADDRESS_TO);
        }

        auto [action, raw_index] = tx.state.pending_actions.get_or_throw(validator);
        uint64_t unlock_time = action.timestamp + config_.validation_delay +
                               config_.low_latency_validator_deadline + constants::REMOVE_BLOCKED_GRACE_PERIOD;
        if (ctx.timestamp < unlock_time) {
            throw ProtocolError(Error::UNAUTHORIZED, fmt::format("removal allowed from {}", unlock_time),
                                {.timestamp = ctx.timestamp});
        }

        if (cleanup) {
            cleanup_blocked(tx, action, to);
        }
        tx.state.pending_actions.clear(raw_index);

        tx.events.on_blocked_pending_action_removed(validator, to, cleanup);
        log::logger()->info("removed blocked {} of {} (cleanup={})", to_string(action.action()),
                            addresses::to_hex(validator), cleanup);
        return true;
    });
}

void Protocol::cleanup_blocked(Transition& tx, const PendingAction& action, const Address& to) {
    ProtocolState& s = tx.state;

    if (const auto* deposit = std::get_if<DepositData>(&action.data)) {
        s.pending_balance_vault -= deposit->amount;
        tx.settlement.add(TransferKind::ASSET_OUT, to, deposit->amount);
    } else if (const auto* withdrawal = std::get_if<WithdrawalData>(&action.data)) {
        s.pending_balance_vault += withdrawal->expected_assets;
        tx.settlement.add(TransferKind::USDN_RELEASE, to, withdrawal->usdn_amount);
    } else if (const auto* open = std::get_if<OpenPositionData>(&action.data)) {
        if (s.tick_version(open->pos_id.tick) == open->pos_id.tick_version) {
            auto [position, penalty] = book::get_long_position(s, open->pos_id);
            book::remove_amount_from_position(s, config_, open->pos_id, position.amount, position.total_expo);
            I128 refund = std::clamp<I128>(position.amount, 0, std::max<I128>(s.balance_long, 0));
            s.balance_long -= refund;
            tx.settlement.add(TransferKind::ASSET_OUT, to, refund);
        }
    } else if (const auto* close = std::get_if<ClosePositionData>(&action.data)) {
        tx.settlement.add(TransferKind::ASSET_OUT, to, close->temp_transfer);
    }

    refund_security_deposit(tx, action, to);
}

// =============================================================================
// Queries
// =============================================================================

ProtocolConfig Protocol::config() const {
    std::shared_lock lock(mutex_);
    return config_;
}

ProtocolState Protocol::snapshot() const {
    std::shared_lock lock(mutex_);
    return state_;
}

bool Protocol::is_initialized() const {
    std::shared_lock lock(mutex_);
    return state_.initialized;
}

I128 Protocol::balance_long() const {
    std::shared_lock lock(mutex_);
    return state_.balance_long;
}

I128 Protocol::balance_vault() const {
    std::shared_lock lock(mutex_);
    return state_.balance_vault;
}

I128 Protocol::pending_balance_vault() const {
    std::shared_lock lock(mutex_);
    return state_.pending_balance_vault;
}

I128 Protocol::total_expo() const {
    std::shared_lock lock(mutex_);
    return state_.total_expo;
}

I128 Protocol::ema() const {
    std::shared_lock lock(mutex_);
    return state_.ema;
}

I128 Protocol::last_funding_per_day() const {
    std::shared_lock lock(mutex_);
    return state_.last_funding_per_day;
}

I128 Protocol::last_price() const {
    std::shared_lock lock(mutex_);
    return state_.last_price;
}

uint64_t Protocol::last_update_timestamp() const {
    std::shared_lock lock(mutex_);
    return state_.last_update_timestamp;
}

I128 Protocol::usdn_total_supply() const {
    std::shared_lock lock(mutex_);
    return state_.usdn_total_supply;
}

uint64_t Protocol::total_long_positions() const {
    std::shared_lock lock(mutex_);
    return state_.total_long_positions;
}

int32_t Protocol::highest_populated_tick() const {
    std::shared_lock lock(mutex_);
    return state_.highest_populated_tick;
}

Uint512 Protocol::liq_multiplier_accumulator() const {
    std::shared_lock lock(mutex_);
    return state_.liq_multiplier_accumulator;
}

uint64_t Protocol::tick_version(int32_t tick) const {
    std::shared_lock lock(mutex_);
    return state_.tick_version(tick);
}

TickData Protocol::tick_data(int32_t tick) const {
    std::shared_lock lock(mutex_);
    const TickData* data = state_.tick_data(tick);
    return data == nullptr ? TickData{} : *data;
}

std::pair<Position, int32_t> Protocol::get_long_position(const PositionId& pos_id) const {
    std::shared_lock lock(mutex_);
    return book::get_long_position(state_, pos_id);
}

I128 Protocol::get_position_value(const PositionId& pos_id, I128 price) const {
    std::shared_lock lock(mutex_);
    return book::get_position_value(state_, pos_id, price);
}

I128 Protocol::effective_price_for_tick(int32_t tick) const {
    std::shared_lock lock(mutex_);
    return book::effective_price_for_tick(state_, tick);
}

I128 Protocol::tick_value(int32_t tick, I128 price) const {
    std::shared_lock lock(mutex_);
    I128 long_balance = funding::long_asset_available(state_.total_expo, state_.balance_long, price,
                                                      state_.last_price);
    U256 mult = multiplier::fixed_precision_multiplier(price, state_.total_expo - long_balance,
                                                       state_.liq_multiplier_accumulator);
    return book::tick_value(state_, tick, price, mult);
}

PendingAction Protocol::get_user_pending_action(const Address& validator) const {
    std::shared_lock lock(mutex_);
    return state_.pending_actions.get(validator).first;
}

std::vector<PendingAction> Protocol::get_actionable_pending_actions(const Address& current_user,
                                                                    uint64_t now) const {
    std::shared_lock lock(mutex_);
    std::vector<PendingAction> result;
    for (auto& entry : state_.pending_actions.get_actionable(current_user, now,
                                                              config_.low_latency_validator_deadline)) {
        result.push_back(std::move(entry.first));
    }
    return result;
}

size_t Protocol::pending_actions_count() const {
    std::shared_lock lock(mutex_);
    return state_.pending_actions.size();
}

I128 Protocol::long_asset_available_with_funding(I128 price, uint64_t timestamp) const {
    std::shared_lock lock(mutex_);
    I128 total = state_.balance_long + state_.balance_vault;
    I128 available = funding::long_asset_available_with_funding(state_, config_, price, timestamp);
    return funding::clamp_bad_debt(available, total - available).balance_long;
}

I128 Protocol::vault_asset_available_with_funding(I128 price, uint64_t timestamp) const {
    std::shared_lock lock(mutex_);
    I128 total = state_.balance_long + state_.balance_vault;
    I128 available = funding::long_asset_available_with_funding(state_, config_, price, timestamp);
    return funding::clamp_bad_debt(available, total - available).balance_vault;
}

I128 Protocol::funding_per_day(uint64_t timestamp) const {
    std::shared_lock lock(mutex_);
    return funding::compute(state_, config_, timestamp).funding_per_day;
}

I128 Protocol::usdn_price(I128 price) const {
    std::shared_lock lock(mutex_);
    if (state_.usdn_total_supply <= 0) return 0;
    I128 vault = funding::vault_asset_available(state_.total_expo, state_.balance_vault, state_.balance_long,
                                                price, state_.last_price);
    return mul_div(vault, price, state_.usdn_total_supply);
}

} // namespace tickvault
