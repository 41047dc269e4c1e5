#ifndef TICKVAULT_CONFIG_HPP
#define TICKVAULT_CONFIG_HPP

#include <cstdint>
#include <string>
#include <string_view>

#include "types.hpp"

namespace tickvault {

// =============================================================================
// Imbalance limits (basis points, 0 disables a limit)
// =============================================================================

struct ImbalanceLimits {
    int64_t open_bps = 500;
    int64_t deposit_bps = 500;
    int64_t withdrawal_bps = 600;
    int64_t close_bps = 600;
    int64_t rebalancer_close_bps = 350;
    int64_t long_target_bps = 550;
};

// =============================================================================
// Protocol Configuration
//
// Read-only to the engine. X18 values are written as decimal strings in JSON
// ("10", "0.5"); counts, seconds and basis points as JSON integers.
// =============================================================================

class ProtocolConfig {
public:
    std::string log_level = "info";

    // Ticks
    int32_t tick_spacing = 100;
    int32_t liquidation_penalty = 200;  // ticks, multiple of tick_spacing

    // Leverage (X18, 1e18 = 1x)
    I128 min_leverage = X18_ONE + 1000000000;  // 1.000000001x
    I128 max_leverage = 10 * X18_ONE;
    int64_t safety_margin_bps = 200;

    // Funding
    I128 funding_sf = 12;               // 3 decimals, 0.012 per day
    I128 initial_ema = 300000000000000; // 0.0003 per day
    uint64_t ema_period = 5 * constants::SECONDS_PER_DAY;

    // Pending actions
    uint64_t validation_delay = 24;
    uint64_t low_latency_validator_deadline = 15 * 60;
    I128 security_deposit_value = X18_ONE / 2;

    // Sizing
    I128 min_long_position = 2 * X18_ONE;
    uint16_t liquidation_iterations = 1;

    // Rebalancer
    int64_t rebalancer_bonus_bps = 8000;

    ImbalanceLimits limits;

    ProtocolConfig() = default;

    static ProtocolConfig defaults() { return ProtocolConfig(); }

    // Load from JSON file / string. Missing keys keep their defaults.
    static ProtocolConfig from_file(std::string_view path);
    static ProtocolConfig from_json(std::string_view content);

    std::string to_json() const;

    // Throws ProtocolError(INVALID_CONFIG)
    void validate() const;

    // Builder methods
    ProtocolConfig& with_tick_spacing(int32_t spacing, int32_t penalty) {
        tick_spacing = spacing;
        liquidation_penalty = penalty;
        return *this;
    }

    ProtocolConfig& with_leverage(I128 min_x18, I128 max_x18) {
        min_leverage = min_x18;
        max_leverage = max_x18;
        return *this;
    }

    ProtocolConfig& with_funding(I128 sf, I128 ema, uint64_t period) {
        funding_sf = sf;
        initial_ema = ema;
        ema_period = period;
        return *this;
    }

    ProtocolConfig& with_validation(uint64_t delay, uint64_t low_latency_deadline) {
        validation_delay = delay;
        low_latency_validator_deadline = low_latency_deadline;
        return *this;
    }

    ProtocolConfig& with_security_deposit(I128 value) {
        security_deposit_value = value;
        return *this;
    }

    ProtocolConfig& with_min_long_position(I128 value) {
        min_long_position = value;
        return *this;
    }

    ProtocolConfig& with_limits(ImbalanceLimits l) {
        limits = l;
        return *this;
    }

    ProtocolConfig& disable_imbalance_limits() {
        limits.open_bps = 0;
        limits.deposit_bps = 0;
        limits.withdrawal_bps = 0;
        limits.close_bps = 0;
        return *this;
    }

    ProtocolConfig& with_log_level(std::string_view level) {
        log_level = std::string(level);
        return *this;
    }
};

} // namespace tickvault

#endif // TICKVAULT_CONFIG_HPP
