#ifndef TICKVAULT_PROTOCOL_HPP
#define TICKVAULT_PROTOCOL_HPP

#include <optional>
#include <shared_mutex>
#include <utility>
#include <vector>

#include "config.hpp"
#include "custody.hpp"
#include "events.hpp"
#include "liquidation.hpp"
#include "oracle.hpp"
#include "pending_actions.hpp"
#include "rebalancer.hpp"
#include "state.hpp"
#include "types.hpp"

namespace tickvault {

// Caller identity, time and attached native value of one call
struct CallContext {
    Address sender{};
    uint64_t timestamp = 0;
    I128 value = 0;
};

struct InitiateOpenResult {
    bool executed = false;
    PositionId pos_id;
};

// =============================================================================
// Protocol - long/vault accounting engine
//
// Every entry point is one atomic transition: it runs on a copy of the state,
// settles custody, then commits. Any ProtocolError leaves the state, custody
// and event sink untouched. Initiate/validate calls return false without
// effect (other than funding and liquidations) while liquidations are pending.
//
// The oracle and custody run under the engine's write lock and must not call
// back into Protocol. The rebalancer and event sink run outside it.
// =============================================================================

class Protocol {
public:
    Protocol(ProtocolConfig config, IPriceOracle& oracle, IAssetCustody& custody, const Address& admin);
    ~Protocol() = default;

    // Non-copyable
    Protocol(const Protocol&) = delete;
    Protocol& operator=(const Protocol&) = delete;

    // =========================================================================
    // Collaborators
    // =========================================================================

    void set_event_sink(IEventSink* sink);
    void set_rebalancer(IRebalancer* rebalancer);

    // Admin only. Tick spacing is frozen once initialized.
    void set_config(const CallContext& ctx, ProtocolConfig config);

    // =========================================================================
    // Entry Points
    // =========================================================================

    void initialize(const CallContext& ctx, I128 deposit_amount, I128 long_amount,
                    I128 desired_liq_price, const PriceData& price_data);

    bool initiate_deposit(const CallContext& ctx, I128 amount, const Address& to,
                          const Address& validator, const PriceData& price_data);
    bool validate_deposit(const CallContext& ctx, const PriceData& price_data);

    bool initiate_withdrawal(const CallContext& ctx, I128 usdn_amount, const Address& to,
                             const Address& validator, const PriceData& price_data);
    bool validate_withdrawal(const CallContext& ctx, const PriceData& price_data);

    InitiateOpenResult initiate_open_position(const CallContext& ctx, I128 amount, I128 desired_liq_price,
                                              const Address& to, const Address& validator,
                                              const PriceData& price_data);
    bool validate_open_position(const CallContext& ctx, const PriceData& price_data);

    bool initiate_close_position(const CallContext& ctx, const PositionId& pos_id, I128 amount_to_close,
                                 const Address& to, const Address& validator, const PriceData& price_data);
    bool validate_close_position(const CallContext& ctx, const PriceData& price_data);

    // Returns the ticks liquidated by this call
    std::vector<LiquidatedTick> liquidate(const CallContext& ctx, const PriceData& price_data,
                                          uint16_t iterations);

    // Validates other users' actions past the low-latency deadline; the caller
    // collects their security deposits. Returns the number validated.
    size_t validate_actionable_pending_actions(const CallContext& ctx, size_t max_validations);

    void remove_blocked_pending_action(const CallContext& ctx, const Address& validator,
                                       const Address& to, bool cleanup);

    // =========================================================================
    // Queries
    // =========================================================================

    ProtocolConfig config() const;
    ProtocolState snapshot() const;
    const Address& admin() const { return admin_; }

    bool is_initialized() const;
    I128 balance_long() const;
    I128 balance_vault() const;
    I128 pending_balance_vault() const;
    I128 total_expo() const;
    I128 ema() const;
    I128 last_funding_per_day() const;
    I128 last_price() const;
    uint64_t last_update_timestamp() const;
    I128 usdn_total_supply() const;
    uint64_t total_long_positions() const;
    int32_t highest_populated_tick() const;
    Uint512 liq_multiplier_accumulator() const;

    uint64_t tick_version(int32_t tick) const;
    TickData tick_data(int32_t tick) const;
    std::pair<Position, int32_t> get_long_position(const PositionId& pos_id) const;
    I128 get_position_value(const PositionId& pos_id, I128 price) const;
    I128 effective_price_for_tick(int32_t tick) const;
    I128 tick_value(int32_t tick, I128 price) const;

    PendingAction get_user_pending_action(const Address& validator) const;
    std::vector<PendingAction> get_actionable_pending_actions(const Address& current_user, uint64_t now) const;
    size_t pending_actions_count() const;

    // Balances as they would be after applying PnL and funding
    I128 long_asset_available_with_funding(I128 price, uint64_t timestamp) const;
    I128 vault_asset_available_with_funding(I128 price, uint64_t timestamp) const;
    I128 funding_per_day(uint64_t timestamp) const;

    // Value of one stable token in X18 at price
    I128 usdn_price(I128 price) const;

private:
    struct Transition;

    template <typename Fn>
    auto transact(const CallContext& ctx, const char* name, Fn&& fn);

    // Funding, PnL, liquidations and the rebalancer for one oracle price
    LiquidationEffects apply_pnl_and_liquidate(Transition& tx, const PriceInfo& price, uint16_t iterations);

    void require_initialized(const Transition& tx) const;
    void require_security_deposit(const CallContext& ctx) const;
    void require_recent(const Transition& tx, uint64_t timestamp) const;
    void check_leverage(I128 start_price, I128 liq_price_without_penalty) const;

    void check_imbalance_deposit(const ProtocolState& state, I128 deposit) const;
    void check_imbalance_withdrawal(const ProtocolState& state, I128 withdrawal) const;
    void check_imbalance_open(const ProtocolState& state, I128 amount, I128 total_expo) const;
    void check_imbalance_close(const ProtocolState& state, I128 total_expo, I128 value) const;

    void add_pending_action(Transition& tx, const PendingAction& action);
    void refund_security_deposit(Transition& tx, const PendingAction& action, const Address& receiver);

    // Checks the pending action of `validator` is ready, then validates it
    bool validate_own(Transition& tx, const CallContext& ctx, ProtocolAction expected,
                      const PriceData& price_data);
    void execute_pending(Transition& tx, const PendingAction& action, uint64_t raw_index,
                         I128 price, const Address& deposit_receiver);

    void execute_deposit(Transition& tx, const PendingAction& action, const DepositData& data, I128 price);
    void execute_withdrawal(Transition& tx, const PendingAction& action, const WithdrawalData& data, I128 price);
    void execute_open(Transition& tx, const PendingAction& action, const OpenPositionData& data, I128 price);
    void execute_close(Transition& tx, const PendingAction& action, const ClosePositionData& data, I128 price);

    void cleanup_blocked(Transition& tx, const PendingAction& action, const Address& to);

    mutable std::shared_mutex mutex_;
    ProtocolConfig config_;
    ProtocolState state_;
    IPriceOracle& oracle_;
    IAssetCustody& custody_;
    Address admin_;
    IEventSink* sink_ = nullptr;
    IRebalancer* rebalancer_ = nullptr;
    NullEventSink null_sink_;
};

} // namespace tickvault

#endif // TICKVAULT_PROTOCOL_HPP
