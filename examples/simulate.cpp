// TickVault - Protocol walkthrough
//
// Seeds a protocol, runs one deposit and one long through their two steps,
// drops the price until the long is liquidated, and prints the balances
// after each step.

#include <tickvault/tickvault.hpp>

#include <iostream>
#include <string>

using namespace tickvault;

namespace {

const Address ADMIN = addresses::from_id(1);
const Address ALICE = addresses::from_id(2);
const Address BOB = addresses::from_id(3);

void print_state(const std::string& label, const Protocol& protocol, I128 price) {
    std::cout << "\n=== " << label << " ===\n"
              << "  price          " << x18::to_decimal_string(price) << "\n"
              << "  balance long   " << x18::to_decimal_string(protocol.balance_long()) << "\n"
              << "  balance vault  " << x18::to_decimal_string(protocol.balance_vault()) << "\n"
              << "  total expo     " << x18::to_decimal_string(protocol.total_expo()) << "\n"
              << "  positions      " << protocol.total_long_positions() << "\n"
              << "  highest tick   " << protocol.highest_populated_tick() << "\n"
              << "  usdn price     " << x18::to_decimal_string(protocol.usdn_price(price)) << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        ProtocolConfig config = argc > 1 ? ProtocolConfig::from_file(argv[1]) : ProtocolConfig::defaults();

        ManualOracle oracle(x18::from_int(2000));
        LedgerCustody custody;
        custody.credit_asset(ADMIN, x18::from_int(1000));
        custody.credit_asset(ALICE, x18::from_int(100));
        custody.credit_asset(BOB, x18::from_int(100));
        custody.credit_ether(ALICE, x18::from_int(10));
        custody.credit_ether(BOB, x18::from_int(10));

        Protocol protocol(config, oracle, custody, ADMIN);
        const PriceData no_data;
        const I128 deposit = config.security_deposit_value;

        uint64_t now = 1700000000;
        protocol.initialize({ADMIN, now, 0}, x18::from_int(100), x18::from_int(100), x18::from_int(1000), no_data);
        print_state("initialized", protocol, oracle.current_price());

        // Vault deposit
        now += 60;
        protocol.initiate_deposit({ALICE, now, deposit}, x18::from_int(3), ALICE, ALICE, no_data);
        now += config.validation_delay;
        protocol.validate_deposit({ALICE, now, 0}, no_data);
        std::cout << "\nalice holds " << x18::to_decimal_string(custody.usdn_balance(ALICE)) << " USDN\n";

        // ~3x long
        now += 60;
        auto opened = protocol.initiate_open_position({BOB, now, deposit}, x18::from_int(2),
                                                      x18::from_int(1400), BOB, BOB, no_data);
        now += config.validation_delay;
        protocol.validate_open_position({BOB, now, 0}, no_data);
        auto [position, penalty] = protocol.get_long_position(opened.pos_id);
        std::cout << "bob opened at tick " << opened.pos_id.tick << " with expo "
                  << x18::to_decimal_string(position.total_expo) << " (penalty " << penalty << " ticks)\n";
        print_state("after open", protocol, oracle.current_price());

        // Crash
        now += 3600;
        oracle.set_price(x18::from_int(1300));
        auto liquidated = protocol.liquidate({ADMIN, now, 0}, no_data, constants::MAX_LIQUIDATION_ITERATION);
        for (const auto& tick : liquidated) {
            std::cout << "\nliquidated tick " << tick.tick << ": " << tick.info.total_positions
                      << " positions, value " << x18::to_decimal_string(tick.tick_value) << "\n";
        }
        print_state("after crash", protocol, oracle.current_price());
    } catch (const ProtocolError& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
