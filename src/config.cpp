// =============================================================================
// config.cpp - Protocol configuration loading and validation
// =============================================================================

#include "tickvault/config.hpp"
#include "tickvault/errors.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <array>
#include <fstream>
#include <sstream>

namespace tickvault {

using json = nlohmann::json;

namespace {

constexpr std::array<std::string_view, 7> LOG_LEVELS = {
    "trace", "debug", "info", "warn", "error", "critical", "off"};

[[noreturn]] void invalid(const std::string& detail) {
    throw ProtocolError(Error::INVALID_CONFIG, detail);
}

void read_x18(const json& j, const char* key, I128& out) {
    if (!j.contains(key)) return;
    const auto& value = j.at(key);
    if (value.is_string()) {
        try {
            out = x18::from_string(value.get<std::string>());
        } catch (const std::invalid_argument& e) {
            invalid(fmt::format("{}: {}", key, e.what()));
        }
    } else if (value.is_number_integer()) {
        out = x18::from_int(value.get<int64_t>());
    } else {
        invalid(fmt::format("{}: expected a decimal string", key));
    }
}

template <typename T>
void read_int(const json& j, const char* key, T& out) {
    if (!j.contains(key)) return;
    const auto& value = j.at(key);
    if (!value.is_number_integer()) {
        invalid(fmt::format("{}: expected an integer", key));
    }
    out = value.get<T>();
}

void check_bps(int64_t value, const char* name) {
    if (value < 0 || value >= constants::BPS_DIVISOR) {
        invalid(fmt::format("{} must be in [0, {})", name, static_cast<int64_t>(constants::BPS_DIVISOR)));
    }
}

} // namespace

ProtocolConfig ProtocolConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        invalid("cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

ProtocolConfig ProtocolConfig::from_json(std::string_view content) {
    ProtocolConfig config;
    json root;
    try {
        root = json::parse(content);
    } catch (const json::parse_error& e) {
        invalid(std::string("malformed JSON: ") + e.what());
    }
    if (!root.is_object()) {
        invalid("top-level JSON value must be an object");
    }

    try {
        if (root.contains("log_level")) {
            config.log_level = root.at("log_level").get<std::string>();
        }
        read_int(root, "tick_spacing", config.tick_spacing);
        read_int(root, "liquidation_penalty", config.liquidation_penalty);
        read_x18(root, "min_long_position", config.min_long_position);
        read_int(root, "liquidation_iterations", config.liquidation_iterations);
        read_int(root, "rebalancer_bonus_bps", config.rebalancer_bonus_bps);

        if (root.contains("leverage")) {
            const auto& lev = root.at("leverage");
            read_x18(lev, "min", config.min_leverage);
            read_x18(lev, "max", config.max_leverage);
            read_int(lev, "safety_margin_bps", config.safety_margin_bps);
        }

        if (root.contains("funding")) {
            const auto& funding = root.at("funding");
            if (funding.contains("scaling_factor")) {
                int64_t sf = 0;
                read_int(funding, "scaling_factor", sf);
                config.funding_sf = sf;
            }
            read_x18(funding, "initial_ema", config.initial_ema);
            read_int(funding, "ema_period", config.ema_period);
        }

        if (root.contains("pending_actions")) {
            const auto& pending = root.at("pending_actions");
            read_int(pending, "validation_delay", config.validation_delay);
            read_int(pending, "low_latency_validator_deadline", config.low_latency_validator_deadline);
            read_x18(pending, "security_deposit", config.security_deposit_value);
        }

        if (root.contains("imbalance_limits")) {
            const auto& limits = root.at("imbalance_limits");
            read_int(limits, "open_bps", config.limits.open_bps);
            read_int(limits, "deposit_bps", config.limits.deposit_bps);
            read_int(limits, "withdrawal_bps", config.limits.withdrawal_bps);
            read_int(limits, "close_bps", config.limits.close_bps);
            read_int(limits, "rebalancer_close_bps", config.limits.rebalancer_close_bps);
            read_int(limits, "long_target_bps", config.limits.long_target_bps);
        }
    } catch (const json::exception& e) {
        invalid(e.what());
    }

    config.validate();
    return config;
}

std::string ProtocolConfig::to_json() const {
    json root;
    root["log_level"] = log_level;
    root["tick_spacing"] = tick_spacing;
    root["liquidation_penalty"] = liquidation_penalty;
    root["min_long_position"] = x18::to_decimal_string(min_long_position);
    root["liquidation_iterations"] = liquidation_iterations;
    root["rebalancer_bonus_bps"] = rebalancer_bonus_bps;
    root["leverage"] = {
        {"min", x18::to_decimal_string(min_leverage)},
        {"max", x18::to_decimal_string(max_leverage)},
        {"safety_margin_bps", safety_margin_bps},
    };
    root["funding"] = {
        {"scaling_factor", static_cast<int64_t>(funding_sf)},
        {"initial_ema", x18::to_decimal_string(initial_ema)},
        {"ema_period", ema_period},
    };
    root["pending_actions"] = {
        {"validation_delay", validation_delay},
        {"low_latency_validator_deadline", low_latency_validator_deadline},
        {"security_deposit", x18::to_decimal_string(security_deposit_value)},
    };
    root["imbalance_limits"] = {
        {"open_bps", limits.open_bps},
        {"deposit_bps", limits.deposit_bps},
        {"withdrawal_bps", limits.withdrawal_bps},
        {"close_bps", limits.close_bps},
        {"rebalancer_close_bps", limits.rebalancer_close_bps},
        {"long_target_bps", limits.long_target_bps},
    };
    return root.dump(2);
}

void ProtocolConfig::validate() const {
    if (tick_spacing <= 0) {
        invalid("tick_spacing must be positive");
    }
    if (liquidation_penalty < 0 || liquidation_penalty % tick_spacing != 0) {
        invalid("liquidation_penalty must be a non-negative multiple of tick_spacing");
    }
    if (min_leverage <= X18_ONE) {
        invalid("min_leverage must be above 1x");
    }
    if (max_leverage <= min_leverage) {
        invalid("max_leverage must be above min_leverage");
    }
    if (funding_sf < 0) {
        invalid("funding scaling factor must not be negative");
    }
    if (ema_period == 0) {
        invalid("ema_period must be positive");
    }
    if (low_latency_validator_deadline < validation_delay) {
        invalid("low_latency_validator_deadline must not precede validation_delay");
    }
    if (security_deposit_value < 0 || min_long_position < 0) {
        invalid("security deposit and minimum position must not be negative");
    }
    if (liquidation_iterations == 0 || liquidation_iterations > constants::MAX_LIQUIDATION_ITERATION) {
        invalid(fmt::format("liquidation_iterations must be in [1, {}]",
                            constants::MAX_LIQUIDATION_ITERATION));
    }
    if (rebalancer_bonus_bps < 0 || rebalancer_bonus_bps > constants::BPS_DIVISOR) {
        invalid("rebalancer_bonus_bps must be in [0, 10000]");
    }
    check_bps(safety_margin_bps, "safety_margin_bps");
    check_bps(limits.open_bps, "open_bps");
    check_bps(limits.deposit_bps, "deposit_bps");
    check_bps(limits.withdrawal_bps, "withdrawal_bps");
    check_bps(limits.close_bps, "close_bps");
    check_bps(limits.rebalancer_close_bps, "rebalancer_close_bps");
    check_bps(limits.long_target_bps, "long_target_bps");

    bool known_level = false;
    for (auto level : LOG_LEVELS) {
        if (level == log_level) known_level = true;
    }
    if (!known_level) {
        invalid("unknown log_level: " + log_level);
    }
}

} // namespace tickvault
