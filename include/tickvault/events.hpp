#ifndef TICKVAULT_EVENTS_HPP
#define TICKVAULT_EVENTS_HPP

#include <functional>
#include <vector>

#include "types.hpp"

namespace tickvault {

// =============================================================================
// Event Sink Interface
// =============================================================================

class IEventSink {
public:
    virtual ~IEventSink() = default;

    // Vault side
    virtual void on_initiated_deposit(const Address& to, const Address& validator, I128 amount,
                                      uint64_t timestamp) {}
    virtual void on_validated_deposit(const Address& to, const Address& validator, I128 amount,
                                      I128 usdn_minted, uint64_t timestamp) {}
    virtual void on_initiated_withdrawal(const Address& to, const Address& validator, I128 usdn_amount,
                                         uint64_t timestamp) {}
    virtual void on_validated_withdrawal(const Address& to, const Address& validator, I128 amount_withdrawn,
                                         I128 usdn_burned, uint64_t timestamp) {}

    // Long side
    virtual void on_initiated_open_position(const Address& owner, const Address& validator, uint64_t timestamp,
                                            I128 total_expo, I128 amount, I128 start_price,
                                            const PositionId& pos_id) {}
    virtual void on_validated_open_position(const Address& owner, const Address& validator, I128 total_expo,
                                            I128 new_start_price, const PositionId& pos_id) {}
    virtual void on_liquidation_price_updated(const PositionId& old_pos_id, const PositionId& new_pos_id) {}
    virtual void on_initiated_close_position(const Address& owner, const Address& validator, const Address& to,
                                             const PositionId& pos_id, I128 original_amount,
                                             I128 amount_to_close, I128 total_expo_remaining) {}
    virtual void on_validated_close_position(const Address& owner, const Address& to, const PositionId& pos_id,
                                             I128 amount_received, I128 profit) {}
    virtual void on_liquidated_position(const Address& user, const PositionId& pos_id, I128 price,
                                        I128 effective_liq_price) {}

    // Book
    virtual void on_liquidated_tick(int32_t tick, uint64_t old_tick_version, I128 price,
                                    I128 effective_tick_price, I128 tick_value) {}
    virtual void on_highest_populated_tick_updated(int32_t tick) {}
    virtual void on_funding_updated(I128 funding_per_day, I128 ema, uint64_t timestamp) {}

    // Pending actions
    virtual void on_security_deposit_refunded(const Address& pending_user, const Address& receiver,
                                              I128 amount) {}
    virtual void on_stale_pending_action_removed(const Address& user, const PositionId& pos_id) {}
    virtual void on_blocked_pending_action_removed(const Address& validator, const Address& to,
                                                   bool cleanup) {}

    // Rebalancer
    virtual void on_rebalancer_triggered(I128 position_amount, I128 trading_expo_filled,
                                         const PositionId& new_pos_id, int64_t close_imbalance_bps) {}
};

// Null sink (no-op)
class NullEventSink : public IEventSink {};

// =============================================================================
// Event Buffer
//
// Records events raised inside a transition; they reach the real sink only
// once the transition has committed.
// =============================================================================

class EventBuffer : public IEventSink {
public:
    using Event = std::function<void(IEventSink&)>;

    void replay(IEventSink& sink) const;
    void clear() { events_.clear(); }
    size_t size() const { return events_.size(); }
    bool empty() const { return events_.empty(); }

    void on_initiated_deposit(const Address& to, const Address& validator, I128 amount,
                              uint64_t timestamp) override;
    void on_validated_deposit(const Address& to, const Address& validator, I128 amount,
                              I128 usdn_minted, uint64_t timestamp) override;
    void on_initiated_withdrawal(const Address& to, const Address& validator, I128 usdn_amount,
                                 uint64_t timestamp) override;
    void on_validated_withdrawal(const Address& to, const Address& validator, I128 amount_withdrawn,
                                 I128 usdn_burned, uint64_t timestamp) override;
    void on_initiated_open_position(const Address& owner, const Address& validator, uint64_t timestamp,
                                    I128 total_expo, I128 amount, I128 start_price,
                                    const PositionId& pos_id) override;
    void on_validated_open_position(const Address& owner, const Address& validator, I128 total_expo,
                                    I128 new_start_price, const PositionId& pos_id) override;
    void on_liquidation_price_updated(const PositionId& old_pos_id, const PositionId& new_pos_id) override;
    void on_initiated_close_position(const Address& owner, const Address& validator, const Address& to,
                                     const PositionId& pos_id, I128 original_amount,
                                     I128 amount_to_close, I128 total_expo_remaining) override;
    void on_validated_close_position(const Address& owner, const Address& to, const PositionId& pos_id,
                                     I128 amount_received, I128 profit) override;
    void on_liquidated_position(const Address& user, const PositionId& pos_id, I128 price,
                                I128 effective_liq_price) override;
    void on_liquidated_tick(int32_t tick, uint64_t old_tick_version, I128 price,
                            I128 effective_tick_price, I128 tick_value) override;
    void on_highest_populated_tick_updated(int32_t tick) override;
    void on_funding_updated(I128 funding_per_day, I128 ema, uint64_t timestamp) override;
    void on_security_deposit_refunded(const Address& pending_user, const Address& receiver,
                                      I128 amount) override;
    void on_stale_pending_action_removed(const Address& user, const PositionId& pos_id) override;
    void on_blocked_pending_action_removed(const Address& validator, const Address& to,
                                           bool cleanup) override;
    void on_rebalancer_triggered(I128 position_amount, I128 trading_expo_filled,
                                 const PositionId& new_pos_id, int64_t close_imbalance_bps) override;

private:
    std::vector<Event> events_;
};

} // namespace tickvault

#endif // TICKVAULT_EVENTS_HPP
