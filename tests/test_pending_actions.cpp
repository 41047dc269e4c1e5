// TickVault - Pending Action Queue Tests

#include <catch2/catch.hpp>
#include <tickvault/errors.hpp>
#include <tickvault/pending_actions.hpp>

using namespace tickvault;

namespace {

const Address ALICE = addresses::from_id(1);
const Address BOB = addresses::from_id(2);
const Address CAROL = addresses::from_id(3);

PendingAction deposit_of(const Address& user, uint64_t timestamp, I128 amount = X18_ONE) {
    PendingAction action;
    action.validator = user;
    action.to = user;
    action.user = user;
    action.timestamp = timestamp;
    action.security_deposit_value = X18_ONE / 2;
    action.data = DepositData{amount, VaultSnapshot{}};
    return action;
}

Error error_of(auto&& fn) {
    try {
        fn();
    } catch (const ProtocolError& e) {
        return e.code();
    }
    FAIL("expected a ProtocolError");
    return Error::INVALID_CONFIG;
}

} // namespace

TEST_CASE("At most one pending action per validator", "[pending]") {
    PendingActionQueue queue;
    uint64_t raw = queue.add(deposit_of(ALICE, 100));
    REQUIRE(raw == 1);
    REQUIRE(queue.has(ALICE));

    SECTION("Second add fails") {
        REQUIRE(error_of([&] { queue.add(deposit_of(ALICE, 200)); }) == Error::PENDING_ACTION);
        REQUIRE(queue.size() == 1);
    }

    SECTION("Allowed again after clearing") {
        queue.clear(raw);
        REQUIRE_FALSE(queue.has(ALICE));
        REQUIRE(queue.add(deposit_of(ALICE, 200)) == 2);
    }

    SECTION("Empty actions are rejected") {
        PendingAction empty;
        empty.validator = BOB;
        REQUIRE(error_of([&] { queue.add(empty); }) == Error::INVALID_PENDING_ACTION);
    }
}

TEST_CASE("Pending action lookup", "[pending]") {
    PendingActionQueue queue;
    queue.add(deposit_of(ALICE, 100, 3 * X18_ONE));

    SECTION("Present") {
        auto [action, raw] = queue.get(ALICE);
        REQUIRE(raw == 1);
        REQUIRE(action.action() == ProtocolAction::VALIDATE_DEPOSIT);
        REQUIRE(std::get<DepositData>(action.data).amount == 3 * X18_ONE);
    }

    SECTION("Absent returns the empty action and raw index zero") {
        auto [action, raw] = queue.get(BOB);
        REQUIRE(raw == 0);
        REQUIRE(action.empty());
        REQUIRE(action.action() == ProtocolAction::NONE);
    }

    SECTION("get_or_throw") {
        REQUIRE(error_of([&] { queue.get_or_throw(BOB); }) == Error::NO_PENDING_ACTION);
        REQUIRE(queue.get_or_throw(ALICE).second == 1);
    }

    SECTION("Clearing an empty raw index") {
        REQUIRE(error_of([&] { queue.clear(0); }) == Error::QUEUE_EMPTY);
        REQUIRE(error_of([&] { queue.clear(2); }) == Error::QUEUE_EMPTY);
        queue.clear(1);
        REQUIRE(error_of([&] { queue.clear(1); }) == Error::QUEUE_EMPTY);
    }
}

TEST_CASE("Raw indices are stable", "[pending]") {
    PendingActionQueue queue;
    uint64_t a = queue.add(deposit_of(ALICE, 100));
    uint64_t b = queue.add(deposit_of(BOB, 110));
    uint64_t c = queue.add(deposit_of(CAROL, 120));

    queue.clear(b);
    REQUIRE(queue.get(CAROL).second == c);
    REQUIRE(queue.front()->second == a);
    REQUIRE_FALSE(queue.at(1).has_value());

    queue.clear(a);
    REQUIRE(queue.front()->second == c);
    REQUIRE(queue.at(0)->second == c);

    // New entries never take a cleared index
    REQUIRE(queue.add(deposit_of(BOB, 130)) == 4);
}

TEST_CASE("Actionable pending actions", "[pending]") {
    PendingActionQueue queue;
    queue.add(deposit_of(ALICE, 100));
    queue.add(deposit_of(BOB, 200));
    queue.add(deposit_of(CAROL, 300));
    const uint64_t deadline = 900;

    SECTION("Nothing before the low-latency deadline") {
        REQUIRE(queue.get_actionable(CAROL, 100 + deadline - 1, deadline).empty());
    }

    SECTION("Oldest first, stops at the first fresh entry") {
        auto actionable = queue.get_actionable(CAROL, 200 + deadline, deadline);
        REQUIRE(actionable.size() == 2);
        REQUIRE(actionable[0].first.validator == ALICE);
        REQUIRE(actionable[1].first.validator == BOB);
    }

    SECTION("The caller's own action is skipped") {
        auto actionable = queue.get_actionable(ALICE, 300 + deadline, deadline);
        REQUIRE(actionable.size() == 2);
        REQUIRE(actionable[0].first.validator == BOB);
    }

    SECTION("Bounded") {
        PendingActionQueue big;
        for (uint64_t i = 0; i < 30; ++i) {
            big.add(deposit_of(addresses::from_id(100 + i), i));
        }
        REQUIRE(big.get_actionable(ALICE, 100000, deadline).size() == constants::MAX_ACTIONABLE_PENDING_ACTIONS);
    }
}
