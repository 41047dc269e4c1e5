#ifndef TICKVAULT_REBALANCER_HPP
#define TICKVAULT_REBALANCER_HPP

#include <optional>

#include "config.hpp"
#include "events.hpp"
#include "state.hpp"
#include "types.hpp"

namespace tickvault {

// =============================================================================
// Rebalancer Interface
// =============================================================================

struct RebalancerState {
    I128 pending_assets = 0;      // deposited by its users, not yet in a position
    I128 max_leverage = 0;        // X18
    PositionId position_id;       // tick == NO_POSITION_TICK when it has none
};

class IRebalancer {
public:
    virtual ~IRebalancer() = default;

    // Read at the start of each transition, outside the protocol lock
    virtual Address address() const = 0;
    virtual RebalancerState state() const = 0;

    // Called after the transition that moved the rebalancer has committed
    virtual void update_position(const PositionId& new_pos_id, I128 previous_position_value) = 0;
};

// =============================================================================
// Trigger
// =============================================================================

struct RebalancerAction {
    I128 close_imbalance_bps = 0;
    I128 previous_position_value = 0;
    I128 pending_assets_used = 0;   // pulled from the rebalancer's custody account
    I128 bonus = 0;
    I128 position_amount = 0;
    I128 trading_expo_filled = 0;
    PositionId new_pos_id;          // NO_POSITION_TICK when nothing was opened
};

// Runs when the close imbalance strictly exceeds the rebalancer limit: closes
// the rebalancer's position into the vault and opens a new one sized to bring
// the long side back to its imbalance target. Returns nullopt when the trigger
// condition does not hold. Balances in `state` are updated in place.
std::optional<RebalancerAction> trigger_rebalancer(ProtocolState& state, const ProtocolConfig& config,
                                                   const Address& rebalancer, const RebalancerState& rebalancer_state,
                                                   I128 price, I128 remaining_collateral, IEventSink& events);

} // namespace tickvault

#endif // TICKVAULT_REBALANCER_HPP
