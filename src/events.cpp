// =============================================================================
// events.cpp - Deferred event delivery
// =============================================================================

#include "tickvault/events.hpp"

namespace tickvault {

void EventBuffer::replay(IEventSink& sink) const {
    for (const auto& event : events_) {
        event(sink);
    }
}

void EventBuffer::on_initiated_deposit(const Address& to, const Address& validator, I128 amount,
                                       uint64_t timestamp) {
    events_.emplace_back([=](IEventSink& s) { s.on_initiated_deposit(to, validator, amount, timestamp); });
}

void EventBuffer::on_validated_deposit(const Address& to, const Address& validator, I128 amount,
                                       I128 usdn_minted, uint64_t timestamp) {
    events_.emplace_back([=](IEventSink& s) {
        s.on_validated_deposit(to, validator, amount, usdn_minted, timestamp);
    });
}

void EventBuffer::on_initiated_withdrawal(const Address& to, const Address& validator, I128 usdn_amount,
                                          uint64_t timestamp) {
    events_.emplace_back([=](IEventSink& s) {
        s.on_initiated_withdrawal(to, validator, usdn_amount, timestamp);
    });
}

void EventBuffer::on_validated_withdrawal(const Address& to, const Address& validator, I128 amount_withdrawn,
                                          I128 usdn_burned, uint64_t timestamp) {
    events_.emplace_back([=](IEventSink& s) {
        s.on_validated_withdrawal(to, validator, amount_withdrawn, usdn_burned, timestamp);
    });
}

void EventBuffer::on_initiated_open_position(const Address& owner, const Address& validator, uint64_t timestamp,
                                             I128 total_expo, I128 amount, I128 start_price,
                                             const PositionId& pos_id) {
    events_.emplace_back([=](IEventSink& s) {
        s.on_initiated_open_position(owner, validator, timestamp, total_expo, amount, start_price, pos_id);
    });
}

void EventBuffer::on_validated_open_position(const Address& owner, const Address& validator, I128 total_expo,
                                             I128 new_start_price, const PositionId& pos_id) {
    events_.emplace_back([=](IEventSink& s) {
        s.on_validated_open_position(owner, validator, total_expo, new_start_price, pos_id);
    });
}

void EventBuffer::on_liquidation_price_updated(const PositionId& old_pos_id, const PositionId& new_pos_id) {
    events_.emplace_back([=](IEventSink& s) { s.on_liquidation_price_updated(old_pos_id, new_pos_id); });
}

void EventBuffer::on_initiated_close_position(const Address& owner, const Address& validator, const Address& to,
                                              const PositionId& pos_id, I128 original_amount,
                                              I128 amount_to_close, I128 total_expo_remaining) {
    events_.emplace_back([=](IEventSink& s) {
        s.on_initiated_close_position(owner, validator, to, pos_id, original_amount, amount_to_close,
                                      total_expo_remaining);
    });
}

void EventBuffer::on_validated_close_position(const Address& owner, const Address& to, const PositionId& pos_id,
                                              I128 amount_received, I128 profit) {
    events_.emplace_back([=](IEventSink& s) {
        s.on_validated_close_position(owner, to, pos_id, amount_received, profit);
    });
}

void EventBuffer::on_liquidated_position(const Address& user, const PositionId& pos_id, I128 price,
                                         I128 effective_liq_price) {
    events_.emplace_back([=](IEventSink& s) {
        s.on_liquidated_position(user, pos_id, price, effective_liq_price);
    });
}

void EventBuffer::on_liquidated_tick(int32_t tick, uint64_t old_tick_version, I128 price,
                                     I128 effective_tick_price, I128 tick_value) {
    events_.emplace_back([=](IEventSink& s) {
        s.on_liquidated_tick(tick, old_tick_version, price, effective_tick_price, tick_value);
    });
}

void EventBuffer::on_highest_populated_tick_updated(int32_t tick) {
    events_.emplace_back([=](IEventSink& s) { s.on_highest_populated_tick_updated(tick); });
}

void EventBuffer::on_funding_updated(I128 funding_per_day, I128 ema, uint64_t timestamp) {
    events_.emplace_back([=](IEventSink& s) { s.on_funding_updated(funding_per_day, ema, timestamp); });
}

void EventBuffer::on_security_deposit_refunded(const Address& pending_user, const Address& receiver,
                                               I128 amount) {
    events_.emplace_back([=](IEventSink& s) {
        s.on_security_deposit_refunded(pending_user, receiver, amount);
    });
}

void EventBuffer::on_stale_pending_action_removed(const Address& user, const PositionId& pos_id) {
    events_.emplace_back([=](IEventSink& s) { s.on_stale_pending_action_removed(user, pos_id); });
}

void EventBuffer::on_blocked_pending_action_removed(const Address& validator, const Address& to,
                                                    bool cleanup) {
    events_.emplace_back([=](IEventSink& s) { s.on_blocked_pending_action_removed(validator, to, cleanup); });
}

void EventBuffer::on_rebalancer_triggered(I128 position_amount, I128 trading_expo_filled,
                                          const PositionId& new_pos_id, int64_t close_imbalance_bps) {
    events_.emplace_back([=](IEventSink& s) {
        s.on_rebalancer_triggered(position_amount, trading_expo_filled, new_pos_id, close_imbalance_bps);
    });
}

} // namespace tickvault
