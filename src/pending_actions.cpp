// =============================================================================
// pending_actions.cpp - Two-phase action queue
// =============================================================================

#include "tickvault/pending_actions.hpp"
#include "tickvault/errors.hpp"

namespace tickvault {

ProtocolAction PendingAction::action() const {
    struct Visitor {
        ProtocolAction operator()(std::monostate) const { return ProtocolAction::NONE; }
        ProtocolAction operator()(const DepositData&) const { return ProtocolAction::VALIDATE_DEPOSIT; }
        ProtocolAction operator()(const WithdrawalData&) const { return ProtocolAction::VALIDATE_WITHDRAWAL; }
        ProtocolAction operator()(const OpenPositionData&) const { return ProtocolAction::VALIDATE_OPEN_POSITION; }
        ProtocolAction operator()(const ClosePositionData&) const { return ProtocolAction::VALIDATE_CLOSE_POSITION; }
    };
    return std::visit(Visitor{}, data);
}

uint64_t PendingActionQueue::add(const PendingAction& action) {
    if (action.empty()) {
        throw ProtocolError(Error::INVALID_PENDING_ACTION, "cannot queue an empty action");
    }
    if (has(action.validator)) {
        throw ProtocolError(Error::PENDING_ACTION, "validator already has a pending action",
                            {.user = action.validator});
    }

    slots_.emplace_back(action);
    uint64_t raw_index = base_ + slots_.size() - 1;
    index_[action.validator] = raw_index;
    return raw_index;
}

std::pair<PendingAction, uint64_t> PendingActionQueue::get(const Address& validator) const {
    auto it = index_.find(validator);
    if (it == index_.end()) {
        return {PendingAction{}, 0};
    }
    const auto& slot = slots_[it->second - base_];
    return {*slot, it->second};
}

std::pair<PendingAction, uint64_t> PendingActionQueue::get_or_throw(const Address& validator) const {
    auto result = get(validator);
    if (result.second == 0) {
        throw ProtocolError(Error::NO_PENDING_ACTION, "", {.user = validator});
    }
    return result;
}

void PendingActionQueue::clear(uint64_t raw_index) {
    if (raw_index < base_ || raw_index - base_ >= slots_.size() || !slots_[raw_index - base_]) {
        throw ProtocolError(Error::QUEUE_EMPTY, "no pending action at raw index " + std::to_string(raw_index));
    }
    auto& slot = slots_[raw_index - base_];
    index_.erase(slot->validator);
    slot.reset();
    compact();
}

std::optional<std::pair<PendingAction, uint64_t>> PendingActionQueue::front() const {
    for (size_t i = 0; i < slots_.size(); ++i) {
        if (slots_[i]) return std::make_pair(*slots_[i], base_ + i);
    }
    return std::nullopt;
}

std::optional<std::pair<PendingAction, uint64_t>> PendingActionQueue::at(size_t offset) const {
    if (offset >= slots_.size() || !slots_[offset]) return std::nullopt;
    return std::make_pair(*slots_[offset], base_ + offset);
}

std::vector<std::pair<PendingAction, uint64_t>> PendingActionQueue::get_actionable(
    const Address& current_user, uint64_t now, uint64_t low_latency_deadline) const {
    std::vector<std::pair<PendingAction, uint64_t>> result;
    for (size_t i = 0; i < slots_.size() && result.size() < constants::MAX_ACTIONABLE_PENDING_ACTIONS; ++i) {
        const auto& slot = slots_[i];
        if (!slot) continue;
        // Queue order is submission order, so nothing after this one is actionable either
        if (slot->timestamp + low_latency_deadline > now) break;
        if (slot->validator == current_user) continue;
        result.emplace_back(*slot, base_ + i);
    }
    return result;
}

void PendingActionQueue::compact() {
    while (!slots_.empty() && !slots_.front()) {
        slots_.pop_front();
        ++base_;
    }
}

} // namespace tickvault
