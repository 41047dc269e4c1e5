// TickVault - Protocol End-to-End Tests

#include <catch2/catch.hpp>
#include <tickvault/tickvault.hpp>

using namespace tickvault;

namespace {

const Address ADMIN = addresses::from_id(1);
const Address ALICE = addresses::from_id(2);
const Address BOB = addresses::from_id(3);
const Address CAROL = addresses::from_id(4);

const PriceData NO_DATA;
constexpr uint64_t T0 = 1700000000;

Error error_of(auto&& fn) {
    try {
        fn();
    } catch (const ProtocolError& e) {
        return e.code();
    }
    FAIL("expected a ProtocolError");
    return Error::INVALID_CONFIG;
}

bool near(I128 actual, I128 expected, I128 tolerance) {
    I128 diff = actual - expected;
    return diff <= tolerance && diff >= -tolerance;
}

struct RecordingSink : IEventSink {
    int initiated_deposits = 0;
    int validated_deposits = 0;
    int validated_opens = 0;
    int deposit_refunds = 0;
    int stale_removed = 0;
    int liquidated_ticks = 0;
    int liquidated_positions = 0;
    int liquidation_price_updates = 0;
    PositionId moved_to;

    void on_initiated_deposit(const Address&, const Address&, I128, uint64_t) override { ++initiated_deposits; }
    void on_validated_deposit(const Address&, const Address&, I128, I128, uint64_t) override {
        ++validated_deposits;
    }
    void on_validated_open_position(const Address&, const Address&, I128, I128, const PositionId&) override {
        ++validated_opens;
    }
    void on_security_deposit_refunded(const Address&, const Address&, I128) override { ++deposit_refunds; }
    void on_stale_pending_action_removed(const Address&, const PositionId&) override { ++stale_removed; }
    void on_liquidated_tick(int32_t, uint64_t, I128, I128, I128) override { ++liquidated_ticks; }
    void on_liquidated_position(const Address&, const PositionId&, I128, I128) override {
        ++liquidated_positions;
    }
    void on_liquidation_price_updated(const PositionId&, const PositionId& new_pos_id) override {
        ++liquidation_price_updates;
        moved_to = new_pos_id;
    }
};

// Reads the protocol back whenever its state is requested
class ReadingRebalancer : public IRebalancer {
public:
    explicit ReadingRebalancer(const Protocol& protocol) : protocol_(protocol) {}

    Address address() const override { return addresses::from_id(77); }

    RebalancerState state() const override {
        ++reads;
        observed_vault = protocol_.balance_vault();
        return RebalancerState{};
    }

    void update_position(const PositionId&, I128) override {}

    mutable int reads = 0;
    mutable I128 observed_vault = 0;

private:
    const Protocol& protocol_;
};

class ProtocolFixture {
public:
    explicit ProtocolFixture(ProtocolConfig cfg = ProtocolConfig::defaults())
        : config(std::move(cfg))
        , oracle(x18::from_int(2000))
        , protocol(config, oracle, custody, ADMIN) {
        custody.credit_asset(ADMIN, x18::from_int(1000));
        for (const Address& user : {ALICE, BOB, CAROL}) {
            custody.credit_asset(user, x18::from_int(100));
            custody.credit_ether(user, x18::from_int(10));
        }
        protocol.set_event_sink(&sink);
    }

    void initialize() {
        protocol.initialize({ADMIN, T0, 0}, x18::from_int(100), x18::from_int(100), x18::from_int(1000), NO_DATA);
    }

    CallContext with_deposit(const Address& sender, uint64_t timestamp) const {
        return CallContext{sender, timestamp, config.security_deposit_value};
    }

    // Opens and validates a long for `user`
    PositionId open_long(const Address& user, I128 amount, I128 desired_liq_price, uint64_t timestamp) {
        auto result = protocol.initiate_open_position(with_deposit(user, timestamp), amount, desired_liq_price,
                                                      user, user, NO_DATA);
        REQUIRE(result.executed);
        REQUIRE(protocol.validate_open_position({user, timestamp + config.validation_delay, 0}, NO_DATA));
        return result.pos_id;
    }

    ProtocolConfig config;
    ManualOracle oracle;
    LedgerCustody custody;
    RecordingSink sink;
    Protocol protocol;
};

} // namespace

// =============================================================================
// Initialization
// =============================================================================

TEST_CASE("Protocol initialization", "[protocol]") {
    ProtocolFixture f;

    SECTION("Actions require initialization") {
        REQUIRE(error_of([&] {
            f.protocol.initiate_deposit(f.with_deposit(ALICE, T0), X18_ONE, ALICE, ALICE, NO_DATA);
        }) == Error::NOT_INITIALIZED);
        REQUIRE(error_of([&] { f.protocol.liquidate({ALICE, T0, 0}, NO_DATA, 1); }) == Error::NOT_INITIALIZED);
    }

    SECTION("Seeds both sides") {
        f.initialize();

        REQUIRE(f.protocol.is_initialized());
        REQUIRE(f.protocol.balance_vault() == x18::from_int(100));
        REQUIRE(f.protocol.balance_long() == x18::from_int(100));
        REQUIRE(f.protocol.usdn_total_supply() == x18::from_int(200000));
        REQUIRE(f.protocol.total_long_positions() == 1);
        REQUIRE(f.protocol.highest_populated_tick() == 69200);
        REQUIRE(f.protocol.usdn_price(x18::from_int(2000)) == X18_ONE);
        REQUIRE(f.protocol.last_update_timestamp() == T0);

        REQUIRE(f.custody.protocol_asset() == x18::from_int(200));
        REQUIRE(f.custody.usdn_balance(ADMIN) == x18::from_int(200000));
        REQUIRE(f.sink.validated_deposits == 1);
        REQUIRE(f.sink.validated_opens == 1);
    }

    SECTION("Only once") {
        f.initialize();
        REQUIRE(error_of([&] { f.initialize(); }) == Error::ALREADY_INITIALIZED);
    }

    SECTION("Rejects a long below the minimum") {
        REQUIRE(error_of([&] {
            f.protocol.initialize({ADMIN, T0, 0}, x18::from_int(100), X18_ONE, x18::from_int(1000), NO_DATA);
        }) == Error::LONG_POSITION_TOO_SMALL);
        REQUIRE_FALSE(f.protocol.is_initialized());
        REQUIRE(f.custody.protocol_asset() == 0);
    }
}

TEST_CASE("Protocol configuration updates", "[protocol]") {
    ProtocolFixture f;

    REQUIRE(error_of([&] { f.protocol.set_config({ALICE, T0, 0}, ProtocolConfig()); }) == Error::UNAUTHORIZED);

    f.initialize();
    REQUIRE(error_of([&] {
        f.protocol.set_config({ADMIN, T0, 0}, ProtocolConfig().with_tick_spacing(10, 200));
    }) == Error::INVALID_CONFIG);

    f.protocol.set_config({ADMIN, T0, 0}, ProtocolConfig().with_validation(60, 900));
    REQUIRE(f.protocol.config().validation_delay == 60);
}

// =============================================================================
// Vault Side
// =============================================================================

TEST_CASE("Deposit and withdrawal round trip", "[protocol][vault]") {
    ProtocolFixture f;
    f.initialize();
    const I128 deposit = f.config.security_deposit_value;
    uint64_t now = T0 + 60;

    REQUIRE(f.protocol.initiate_deposit(f.with_deposit(ALICE, now), x18::from_int(3), ALICE, ALICE, NO_DATA));
    REQUIRE(f.protocol.pending_balance_vault() == x18::from_int(3));
    REQUIRE(f.protocol.pending_actions_count() == 1);
    REQUIRE(f.custody.asset_balance(ALICE) == x18::from_int(97));
    REQUIRE(f.custody.ether_balance(ALICE) == x18::from_int(10) - deposit);
    REQUIRE(f.custody.protocol_ether() == deposit);

    SECTION("Validation waits for the delay") {
        REQUIRE(error_of([&] {
            f.protocol.validate_deposit({ALICE, now + f.config.validation_delay - 1, 0}, NO_DATA);
        }) == Error::VALIDATION_TOO_EARLY);
        REQUIRE(error_of([&] {
            f.protocol.validate_withdrawal({ALICE, now + f.config.validation_delay, 0}, NO_DATA);
        }) == Error::INVALID_PENDING_ACTION);
        REQUIRE(error_of([&] {
            f.protocol.validate_deposit({BOB, now + f.config.validation_delay, 0}, NO_DATA);
        }) == Error::NO_PENDING_ACTION);
        REQUIRE(f.protocol.pending_actions_count() == 1);
    }

    SECTION("Mint then burn") {
        now += f.config.validation_delay;
        REQUIRE(f.protocol.validate_deposit({ALICE, now, 0}, NO_DATA));

        I128 minted = f.custody.usdn_balance(ALICE);
        REQUIRE(near(minted, x18::from_int(6000), X18_ONE));
        REQUIRE(f.protocol.pending_balance_vault() == 0);
        REQUIRE(f.protocol.pending_actions_count() == 0);
        REQUIRE(near(f.protocol.balance_vault(), x18::from_int(103), X18_ONE / 100));
        REQUIRE(f.protocol.usdn_total_supply() == x18::from_int(200000) + minted);
        REQUIRE(f.custody.ether_balance(ALICE) == x18::from_int(10));
        REQUIRE(f.sink.initiated_deposits == 1);
        REQUIRE(f.sink.validated_deposits == 2);

        now += 60;
        REQUIRE(f.protocol.initiate_withdrawal(f.with_deposit(ALICE, now), minted, ALICE, ALICE, NO_DATA));
        REQUIRE(f.custody.usdn_balance(ALICE) == 0);
        REQUIRE(f.custody.protocol_usdn_locked() == minted);
        REQUIRE(f.protocol.pending_balance_vault() < 0);

        now += f.config.validation_delay;
        REQUIRE(f.protocol.validate_withdrawal({ALICE, now, 0}, NO_DATA));
        REQUIRE(near(f.custody.asset_balance(ALICE), x18::from_int(100), X18_ONE / 100));
        REQUIRE(f.custody.protocol_usdn_locked() == 0);
        REQUIRE(f.protocol.usdn_total_supply() == x18::from_int(200000));
        REQUIRE(f.protocol.pending_balance_vault() == 0);
        REQUIRE(f.custody.ether_balance(ALICE) == x18::from_int(10));
    }
}

TEST_CASE("Initiate checks", "[protocol]") {
    ProtocolFixture f;
    f.initialize();
    uint64_t now = T0 + 60;

    SECTION("Security deposit must match") {
        REQUIRE(error_of([&] {
            f.protocol.initiate_deposit({ALICE, now, 0}, x18::from_int(3), ALICE, ALICE, NO_DATA);
        }) == Error::SECURITY_DEPOSIT_VALUE);
        REQUIRE(error_of([&] {
            f.protocol.initiate_deposit({ALICE, now, X18_ONE}, x18::from_int(3), ALICE, ALICE, NO_DATA);
        }) == Error::SECURITY_DEPOSIT_VALUE);
        REQUIRE(f.custody.ether_balance(ALICE) == x18::from_int(10));
        REQUIRE(f.custody.asset_balance(ALICE) == x18::from_int(100));
    }

    SECTION("Parameters") {
        REQUIRE(error_of([&] {
            f.protocol.initiate_deposit(f.with_deposit(ALICE, now), 0, ALICE, ALICE, NO_DATA);
        }) == Error::ZERO_AMOUNT);
        REQUIRE(error_of([&] {
            f.protocol.initiate_deposit(f.with_deposit(ALICE, now), X18_ONE, addresses::ZERO, ALICE, NO_DATA);
        }) == Error::INVALID_ADDRESS_TO);
        REQUIRE(error_of([&] {
            f.protocol.initiate_deposit(f.with_deposit(ALICE, now), X18_ONE, ALICE, addresses::ZERO, NO_DATA);
        }) == Error::INVALID_ADDRESS_VALIDATOR);
        REQUIRE(error_of([&] {
            f.protocol.initiate_deposit(f.with_deposit(ALICE, T0 - 1), X18_ONE, ALICE, ALICE, NO_DATA);
        }) == Error::TIMESTAMP_TOO_OLD);
    }

    SECTION("One pending action per validator") {
        REQUIRE(f.protocol.initiate_deposit(f.with_deposit(ALICE, now), X18_ONE, ALICE, ALICE, NO_DATA));
        REQUIRE(error_of([&] {
            f.protocol.initiate_deposit(f.with_deposit(ALICE, now + 1), X18_ONE, ALICE, ALICE, NO_DATA);
        }) == Error::PENDING_ACTION);
        REQUIRE(f.custody.ether_balance(ALICE) == x18::from_int(10) - f.config.security_deposit_value);
        REQUIRE(f.custody.asset_balance(ALICE) == x18::from_int(99));

        // A different validator is free
        REQUIRE(f.protocol.initiate_deposit(f.with_deposit(ALICE, now + 1), X18_ONE, ALICE, BOB, NO_DATA));
        REQUIRE(f.protocol.pending_actions_count() == 2);
    }

    SECTION("Imbalance limit") {
        REQUIRE(error_of([&] {
            f.protocol.initiate_deposit(f.with_deposit(ALICE, now), x18::from_int(20), ALICE, ALICE, NO_DATA);
        }) == Error::IMBALANCE_LIMIT_REACHED);
        REQUIRE(error_of([&] {
            f.protocol.initiate_open_position(f.with_deposit(BOB, now), x18::from_int(50), x18::from_int(1500),
                                              BOB, BOB, NO_DATA);
        }) == Error::IMBALANCE_LIMIT_REACHED);
    }

    SECTION("Failures emit nothing") {
        REQUIRE(f.sink.initiated_deposits == 0);
        REQUIRE(f.sink.deposit_refunds == 0);
    }
}

// =============================================================================
// Long Side
// =============================================================================

TEST_CASE("Open and close a long", "[protocol][long]") {
    ProtocolFixture f;
    f.initialize();
    uint64_t now = T0 + 60;

    auto opened = f.protocol.initiate_open_position(f.with_deposit(BOB, now), x18::from_int(2),
                                                    x18::from_int(1400), BOB, BOB, NO_DATA);
    REQUIRE(opened.executed);
    REQUIRE(f.protocol.total_long_positions() == 2);
    REQUIRE(f.custody.asset_balance(BOB) == x18::from_int(98));
    REQUIRE_FALSE(f.protocol.get_long_position(opened.pos_id).first.validated);

    SECTION("Unvalidated positions cannot close") {
        REQUIRE(error_of([&] {
            f.protocol.initiate_close_position(f.with_deposit(BOB, now + 1), opened.pos_id, x18::from_int(2),
                                               BOB, CAROL, NO_DATA);
        }) == Error::POSITION_NOT_VALIDATED);
    }

    SECTION("Validate then close") {
        now += f.config.validation_delay;
        REQUIRE(f.protocol.validate_open_position({BOB, now, 0}, NO_DATA));
        auto [position, penalty] = f.protocol.get_long_position(opened.pos_id);
        REQUIRE(position.validated);
        REQUIRE(position.user == BOB);
        REQUIRE(penalty == f.config.liquidation_penalty);
        REQUIRE(position.total_expo > position.amount);
        REQUIRE(f.custody.ether_balance(BOB) == x18::from_int(10));

        now += 60;
        REQUIRE(error_of([&] {
            f.protocol.initiate_close_position(f.with_deposit(ALICE, now), opened.pos_id, x18::from_int(2),
                                               ALICE, ALICE, NO_DATA);
        }) == Error::UNAUTHORIZED);
        REQUIRE(error_of([&] {
            f.protocol.initiate_close_position(f.with_deposit(BOB, now), opened.pos_id, x18::from_int(3),
                                               BOB, BOB, NO_DATA);
        }) == Error::AMOUNT_TO_CLOSE_TOO_HIGH);
        REQUIRE(error_of([&] {
            f.protocol.initiate_close_position(f.with_deposit(BOB, now), opened.pos_id, X18_ONE, BOB, BOB,
                                               NO_DATA);
        }) == Error::LONG_POSITION_TOO_SMALL);

        REQUIRE(f.protocol.initiate_close_position(f.with_deposit(BOB, now), opened.pos_id, x18::from_int(2),
                                                   BOB, BOB, NO_DATA));
        REQUIRE(f.protocol.total_long_positions() == 1);

        now += f.config.validation_delay;
        REQUIRE(f.protocol.validate_close_position({BOB, now, 0}, NO_DATA));
        REQUIRE(near(f.custody.asset_balance(BOB), x18::from_int(100), X18_ONE / 20));
        REQUIRE(f.custody.ether_balance(BOB) == x18::from_int(10));
        REQUIRE(f.protocol.pending_actions_count() == 0);
    }
}

TEST_CASE("Validation at a moved price", "[protocol][long]") {
    ProtocolFixture f(ProtocolConfig().disable_imbalance_limits());
    f.initialize();
    uint64_t now = T0 + 60;

    SECTION("Open repriced above max leverage moves to a safer tick") {
        auto opened = f.protocol.initiate_open_position(f.with_deposit(BOB, now), x18::from_int(2),
                                                        x18::from_int(1750), BOB, BOB, NO_DATA);
        REQUIRE(opened.executed);

        uint64_t validation = now + f.config.validation_delay;
        f.oracle.set_price_at(validation, x18::from_int(1850));
        REQUIRE(f.protocol.validate_open_position({BOB, validation, 0}, NO_DATA));

        REQUIRE(f.sink.liquidation_price_updates == 1);
        REQUIRE(f.sink.moved_to.tick < opened.pos_id.tick);
        REQUIRE(f.sink.liquidated_ticks == 0);
        REQUIRE(f.protocol.total_long_positions() == 2);
        REQUIRE(error_of([&] { f.protocol.get_long_position(opened.pos_id); }) == Error::POSITION_NOT_FOUND);

        auto [position, penalty] = f.protocol.get_long_position(f.sink.moved_to);
        REQUIRE(position.validated);
        REQUIRE(position.user == BOB);
        REQUIRE(position.amount == x18::from_int(2));
        I128 liq = f.protocol.effective_price_for_tick(f.sink.moved_to.tick - penalty);
        REQUIRE(pricing::get_leverage(x18::from_int(1850), liq) <= f.config.max_leverage);
        REQUIRE(f.custody.ether_balance(BOB) == x18::from_int(10));
    }

    SECTION("Close underwater at validation leaves its value in the vault") {
        PositionId pos_id = f.open_long(BOB, x18::from_int(2), x18::from_int(1750), now);
        now += 60;
        REQUIRE(f.protocol.initiate_close_position(f.with_deposit(BOB, now), pos_id, x18::from_int(2), BOB, BOB,
                                                   NO_DATA));
        I128 protocol_asset = f.custody.protocol_asset();

        uint64_t validation = now + f.config.validation_delay;
        f.oracle.set_price_at(validation, x18::from_int(1600));
        REQUIRE(f.protocol.validate_close_position({BOB, validation, 0}, NO_DATA));

        REQUIRE(f.sink.liquidated_positions == 1);
        REQUIRE(f.sink.liquidated_ticks == 0);
        REQUIRE(f.custody.asset_balance(BOB) == x18::from_int(98));
        REQUIRE(f.custody.protocol_asset() == protocol_asset);
        REQUIRE(f.custody.ether_balance(BOB) == x18::from_int(10));
        REQUIRE(f.protocol.pending_actions_count() == 0);
        REQUIRE(f.protocol.total_long_positions() == 1);
    }
}

TEST_CASE("Liquidations block user actions until cleared", "[protocol][liquidation]") {
    ProtocolFixture f(ProtocolConfig().disable_imbalance_limits());
    f.initialize();
    f.open_long(BOB, x18::from_int(2), x18::from_int(1750), T0 + 60);
    f.open_long(CAROL, x18::from_int(2), x18::from_int(1650), T0 + 120);
    REQUIRE(f.protocol.total_long_positions() == 3);

    f.oracle.set_price(x18::from_int(1500));
    uint64_t now = T0 + 600;

    REQUIRE_FALSE(f.protocol.initiate_deposit(f.with_deposit(ALICE, now), X18_ONE, ALICE, ALICE, NO_DATA));
    REQUIRE(f.sink.liquidated_ticks == 1);
    REQUIRE(f.protocol.total_long_positions() == 2);
    REQUIRE(f.protocol.pending_actions_count() == 0);
    REQUIRE(f.custody.asset_balance(ALICE) == x18::from_int(100));
    REQUIRE(f.custody.ether_balance(ALICE) == x18::from_int(10));

    auto ticks = f.protocol.liquidate({ADMIN, now + 1, 0}, NO_DATA, constants::MAX_LIQUIDATION_ITERATION);
    REQUIRE(ticks.size() == 1);
    REQUIRE(f.protocol.total_long_positions() == 1);
    REQUIRE(f.protocol.highest_populated_tick() == 69200);
    REQUIRE(f.protocol.balance_long() >= 0);
    REQUIRE(f.protocol.balance_vault() >= 0);

    REQUIRE(f.protocol.initiate_deposit(f.with_deposit(ALICE, now + 2), X18_ONE, ALICE, ALICE, NO_DATA));
}

TEST_CASE("Open liquidated before validation", "[protocol][liquidation]") {
    ProtocolFixture f(ProtocolConfig().disable_imbalance_limits());
    f.initialize();
    uint64_t now = T0 + 60;

    auto opened = f.protocol.initiate_open_position(f.with_deposit(BOB, now), x18::from_int(2),
                                                    x18::from_int(1750), BOB, BOB, NO_DATA);
    REQUIRE(opened.executed);

    f.oracle.set_price(x18::from_int(1500));
    auto ticks = f.protocol.liquidate({ADMIN, now + 10, 0}, NO_DATA, constants::MAX_LIQUIDATION_ITERATION);
    REQUIRE(ticks.size() == 1);
    REQUIRE(f.protocol.tick_version(opened.pos_id.tick) == opened.pos_id.tick_version + 1);

    SECTION("Validation only returns the security deposit") {
        REQUIRE(f.protocol.validate_open_position({BOB, now + f.config.validation_delay, 0}, NO_DATA));
        REQUIRE(f.custody.asset_balance(BOB) == x18::from_int(98));
        REQUIRE(f.custody.ether_balance(BOB) == x18::from_int(10));
        REQUIRE(f.protocol.pending_actions_count() == 0);
        REQUIRE(f.sink.validated_opens == 1);
    }

    SECTION("A new action replaces the stale one") {
        REQUIRE(f.protocol.initiate_deposit(f.with_deposit(BOB, now + 20), X18_ONE, BOB, BOB, NO_DATA));
        REQUIRE(f.sink.stale_removed == 1);
        REQUIRE(f.protocol.pending_actions_count() == 1);
        REQUIRE(f.protocol.get_user_pending_action(BOB).action() == ProtocolAction::VALIDATE_DEPOSIT);
        REQUIRE(f.custody.ether_balance(BOB) == x18::from_int(10) - f.config.security_deposit_value);
    }
}

// =============================================================================
// Pending Action Handling
// =============================================================================

TEST_CASE("Validating actionable pending actions of other users", "[protocol][pending]") {
    ProtocolFixture f;
    f.initialize();
    uint64_t now = T0 + 60;
    REQUIRE(f.protocol.initiate_deposit(f.with_deposit(ALICE, now), x18::from_int(3), ALICE, ALICE, NO_DATA));

    uint64_t later = now + f.config.low_latency_validator_deadline;
    REQUIRE(f.protocol.get_actionable_pending_actions(CAROL, later - 1).empty());
    REQUIRE(f.protocol.get_actionable_pending_actions(ALICE, later).empty());
    REQUIRE(f.protocol.get_actionable_pending_actions(CAROL, later).size() == 1);

    REQUIRE(f.protocol.validate_actionable_pending_actions({CAROL, later, 0}, 5) == 1);
    REQUIRE(f.custody.ether_balance(CAROL) == x18::from_int(10) + f.config.security_deposit_value);
    REQUIRE(f.custody.ether_balance(ALICE) == x18::from_int(10) - f.config.security_deposit_value);
    REQUIRE(near(f.custody.usdn_balance(ALICE), x18::from_int(6000), X18_ONE));
    REQUIRE(f.protocol.pending_actions_count() == 0);

    REQUIRE(f.protocol.validate_actionable_pending_actions({CAROL, later + 1, 0}, 5) == 0);
}

TEST_CASE("Failed security deposit refund rolls back validation", "[protocol][pending]") {
    ProtocolFixture f;
    f.initialize();
    uint64_t now = T0 + 60;
    REQUIRE(f.protocol.initiate_deposit(f.with_deposit(ALICE, now), x18::from_int(3), ALICE, CAROL, NO_DATA));
    I128 vault_before = f.protocol.balance_vault();

    f.custody.set_rejects_ether(CAROL, true);
    now += f.config.validation_delay;
    REQUIRE(error_of([&] { f.protocol.validate_deposit({CAROL, now, 0}, NO_DATA); }) == Error::ETHER_REFUND_FAILED);
    REQUIRE(f.protocol.pending_actions_count() == 1);
    REQUIRE(f.protocol.balance_vault() == vault_before);
    REQUIRE(f.custody.usdn_balance(ALICE) == 0);
    REQUIRE(f.sink.validated_deposits == 1);

    f.custody.set_rejects_ether(CAROL, false);
    REQUIRE(f.protocol.validate_deposit({CAROL, now, 0}, NO_DATA));
    REQUIRE(f.custody.usdn_balance(ALICE) > 0);
    REQUIRE(f.custody.ether_balance(CAROL) == x18::from_int(10) + f.config.security_deposit_value);
}

TEST_CASE("Admin removal of blocked actions", "[protocol][pending]") {
    ProtocolFixture f;
    f.initialize();
    uint64_t now = T0 + 60;
    uint64_t unlock = now + f.config.validation_delay + f.config.low_latency_validator_deadline +
                      constants::REMOVE_BLOCKED_GRACE_PERIOD;

    SECTION("Deposit") {
        REQUIRE(f.protocol.initiate_deposit(f.with_deposit(ALICE, now), x18::from_int(3), ALICE, ALICE, NO_DATA));

        REQUIRE(error_of([&] { f.protocol.remove_blocked_pending_action({ADMIN, unlock - 1, 0}, ALICE, ALICE, true); })
                == Error::UNAUTHORIZED);
        REQUIRE(error_of([&] { f.protocol.remove_blocked_pending_action({BOB, unlock, 0}, ALICE, ALICE, true); })
                == Error::UNAUTHORIZED);
        REQUIRE(error_of([&] {
            f.protocol.remove_blocked_pending_action({ADMIN, unlock, 0}, ALICE, addresses::ZERO, true);
        }) == Error::INVALID_ADDRESS_TO);
        REQUIRE(error_of([&] { f.protocol.remove_blocked_pending_action({ADMIN, unlock, 0}, BOB, BOB, true); })
                == Error::NO_PENDING_ACTION);

        f.protocol.remove_blocked_pending_action({ADMIN, unlock, 0}, ALICE, ALICE, true);
        REQUIRE(f.protocol.pending_actions_count() == 0);
        REQUIRE(f.protocol.pending_balance_vault() == 0);
        REQUIRE(f.custody.asset_balance(ALICE) == x18::from_int(100));
        REQUIRE(f.custody.ether_balance(ALICE) == x18::from_int(10));
    }

    SECTION("Deposit without cleanup") {
        REQUIRE(f.protocol.initiate_deposit(f.with_deposit(ALICE, now), x18::from_int(3), ALICE, ALICE, NO_DATA));
        f.protocol.remove_blocked_pending_action({ADMIN, unlock, 0}, ALICE, ALICE, false);
        REQUIRE(f.protocol.pending_actions_count() == 0);
        REQUIRE(f.custody.asset_balance(ALICE) == x18::from_int(97));
        REQUIRE(f.custody.ether_balance(ALICE) == x18::from_int(10) - f.config.security_deposit_value);
    }

    SECTION("Withdrawal") {
        f.custody.credit_usdn(ALICE, x18::from_int(1000));
        REQUIRE(f.protocol.initiate_withdrawal(f.with_deposit(ALICE, now), x18::from_int(1000), ALICE, ALICE,
                                               NO_DATA));
        REQUIRE(f.protocol.pending_balance_vault() < 0);
        REQUIRE(f.custody.usdn_balance(ALICE) == 0);

        f.protocol.remove_blocked_pending_action({ADMIN, unlock, 0}, ALICE, ALICE, true);
        REQUIRE(f.protocol.pending_actions_count() == 0);
        REQUIRE(f.protocol.pending_balance_vault() == 0);
        REQUIRE(f.custody.usdn_balance(ALICE) == x18::from_int(1000));
        REQUIRE(f.custody.protocol_usdn_locked() == 0);
        REQUIRE(f.custody.ether_balance(ALICE) == x18::from_int(10));
    }

    SECTION("Close position") {
        PositionId pos_id = f.open_long(BOB, x18::from_int(2), x18::from_int(1400), now);
        uint64_t close_at = now + 60;
        REQUIRE(f.protocol.initiate_close_position(f.with_deposit(BOB, close_at), pos_id, x18::from_int(2), BOB,
                                                   BOB, NO_DATA));
        REQUIRE(f.custody.asset_balance(BOB) == x18::from_int(98));

        uint64_t close_unlock = unlock + 60;
        f.protocol.remove_blocked_pending_action({ADMIN, close_unlock, 0}, BOB, BOB, true);
        REQUIRE(f.protocol.pending_actions_count() == 0);
        REQUIRE(near(f.custody.asset_balance(BOB), x18::from_int(100), X18_ONE / 20));
        REQUIRE(f.custody.ether_balance(BOB) == x18::from_int(10));
    }

    SECTION("Refused security deposit reverts the removal") {
        REQUIRE(f.protocol.initiate_deposit(f.with_deposit(ALICE, now), x18::from_int(3), ALICE, ALICE, NO_DATA));
        f.custody.set_rejects_ether(CAROL, true);

        REQUIRE(error_of([&] { f.protocol.remove_blocked_pending_action({ADMIN, unlock, 0}, ALICE, CAROL, true); })
                == Error::ETHER_REFUND_FAILED);
        REQUIRE(f.protocol.pending_actions_count() == 1);
        REQUIRE(f.protocol.pending_balance_vault() == x18::from_int(3));
        REQUIRE(f.custody.asset_balance(CAROL) == x18::from_int(100));
        REQUIRE(f.protocol.get_user_pending_action(ALICE).action() == ProtocolAction::VALIDATE_DEPOSIT);

        f.protocol.remove_blocked_pending_action({ADMIN, unlock, 0}, ALICE, ALICE, true);
        REQUIRE(f.protocol.pending_actions_count() == 0);
    }

    SECTION("Open position") {
        auto opened = f.protocol.initiate_open_position(f.with_deposit(BOB, now), x18::from_int(2),
                                                        x18::from_int(1400), BOB, BOB, NO_DATA);
        REQUIRE(opened.executed);

        f.protocol.remove_blocked_pending_action({ADMIN, unlock, 0}, BOB, BOB, true);
        REQUIRE(f.protocol.total_long_positions() == 1);
        REQUIRE(f.custody.asset_balance(BOB) == x18::from_int(100));
        REQUIRE(f.custody.ether_balance(BOB) == x18::from_int(10));
    }
}

// =============================================================================
// Collaborators
// =============================================================================

TEST_CASE("Rebalancer may read the protocol while a transition starts", "[protocol][rebalancer]") {
    ProtocolFixture f;
    ReadingRebalancer rebalancer(f.protocol);
    f.initialize();
    f.protocol.set_rebalancer(&rebalancer);

    REQUIRE(f.protocol.initiate_deposit(f.with_deposit(ALICE, T0 + 60), x18::from_int(3), ALICE, ALICE, NO_DATA));
    REQUIRE(rebalancer.reads == 1);
    REQUIRE(rebalancer.observed_vault == x18::from_int(100));
    REQUIRE(f.protocol.pending_balance_vault() == x18::from_int(3));
}
