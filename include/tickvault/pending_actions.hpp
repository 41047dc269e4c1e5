#ifndef TICKVAULT_PENDING_ACTIONS_HPP
#define TICKVAULT_PENDING_ACTIONS_HPP

#include <deque>
#include <optional>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "types.hpp"
#include "uint512.hpp"

namespace tickvault {

// =============================================================================
// Pending Action Payloads
// =============================================================================

// Vault snapshot taken at initiation; the validation re-prices against it
struct VaultSnapshot {
    I128 asset_price = 0;
    I128 total_expo = 0;
    I128 balance_vault = 0;
    I128 balance_long = 0;
    I128 usdn_total_supply = 0;
};

struct DepositData {
    I128 amount = 0;
    VaultSnapshot snapshot;
};

struct WithdrawalData {
    I128 usdn_amount = 0;
    I128 expected_assets = 0;   // subtracted from pending_balance_vault at initiation
    VaultSnapshot snapshot;
};

struct OpenPositionData {
    PositionId pos_id;
    I128 amount = 0;
    I128 start_price = 0;
};

struct ClosePositionData {
    PositionId pos_id;
    int32_t liquidation_penalty = 0;
    I128 amount = 0;               // collateral being closed
    I128 total_expo = 0;           // exposure being closed
    U256 close_multiplier;         // multiplier at initiation
    I128 temp_transfer = 0;        // value taken out of balance_long at initiation
};

using PendingActionData = std::variant<std::monostate, DepositData, WithdrawalData,
                                       OpenPositionData, ClosePositionData>;

struct PendingAction {
    Address validator{};
    Address to{};
    Address user{};                // initiator
    uint64_t timestamp = 0;
    I128 security_deposit_value = 0;
    PendingActionData data;

    bool empty() const { return std::holds_alternative<std::monostate>(data); }

    // ProtocolAction of the matching validation (NONE when empty)
    ProtocolAction action() const;
};

// =============================================================================
// Pending Action Queue
//
// FIFO of pending actions with one entry per validator. Entries are addressed
// by a raw index that is never reused; cleared slots stay empty until
// everything before them has been cleared too.
// =============================================================================

class PendingActionQueue {
public:
    PendingActionQueue() = default;

    // Throws ProtocolError(PENDING_ACTION) if the validator already has an entry
    uint64_t add(const PendingAction& action);

    // Empty action and raw index 0 when the validator has nothing queued
    std::pair<PendingAction, uint64_t> get(const Address& validator) const;

    // Throws ProtocolError(NO_PENDING_ACTION)
    std::pair<PendingAction, uint64_t> get_or_throw(const Address& validator) const;

    bool has(const Address& validator) const { return index_.count(validator) != 0; }

    // Throws ProtocolError(QUEUE_EMPTY) if nothing is stored at raw_index
    void clear(uint64_t raw_index);

    // Oldest queued entry
    std::optional<std::pair<PendingAction, uint64_t>> front() const;

    // Entry at a position relative to the front (empty slots included)
    std::optional<std::pair<PendingAction, uint64_t>> at(size_t offset) const;

    // Up to MAX_ACTIONABLE_PENDING_ACTIONS entries from the front whose low-latency
    // window has elapsed, skipping the caller's own
    std::vector<std::pair<PendingAction, uint64_t>> get_actionable(
        const Address& current_user, uint64_t now, uint64_t low_latency_deadline) const;

    size_t size() const { return index_.size(); }
    bool empty() const { return index_.empty(); }

private:
    void compact();

    std::deque<std::optional<PendingAction>> slots_;
    uint64_t base_ = 1;  // raw index of slots_.front(); 0 means "none"
    std::unordered_map<Address, uint64_t, AddressHash> index_;
};

} // namespace tickvault

#endif // TICKVAULT_PENDING_ACTIONS_HPP
