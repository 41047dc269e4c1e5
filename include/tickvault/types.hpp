#ifndef TICKVAULT_TYPES_HPP
#define TICKVAULT_TYPES_HPP

#include <cstdint>
#include <array>
#include <limits>
#include <string>
#include <string_view>

namespace tickvault {

// =============================================================================
// Addresses (20-byte account identifiers)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

constexpr Address ZERO = {};

// Deterministic address from a small integer id (tests, examples)
constexpr Address from_id(uint64_t id) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((id >> (8 * i)) & 0xFF);
    }
    return addr;
}

constexpr bool is_zero(const Address& addr) {
    for (auto b : addr) {
        if (b != 0) return false;
    }
    return true;
}

std::string to_hex(const Address& addr);

} // namespace addresses

struct AddressHash {
    size_t operator()(const Address& a) const noexcept {
        uint64_t h = 0;
        for (auto b : a) h = h * 31 + b;
        return static_cast<size_t>(h);
    }
};

// =============================================================================
// Fixed-Point Arithmetic (X18 = 18 decimal places)
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

constexpr I128 X18_ONE = 1000000000000000000LL;  // 1e18
constexpr I128 I128_MAX = static_cast<I128>(~U128(0) >> 1);

namespace x18 {

inline I128 from_int(int64_t v) {
    return static_cast<I128>(v) * X18_ONE;
}

// Parse "123", "-1.5", "0.000000000000000001" into X18. Throws std::invalid_argument.
I128 from_string(std::string_view text);

// Raw integer digits ("1500000000000000000")
std::string to_string(I128 v);

// Human readable decimal ("1.5")
std::string to_decimal_string(I128 v);

} // namespace x18

// =============================================================================
// Protocol Constants
// =============================================================================

namespace constants {

constexpr I128 BPS_DIVISOR = 10000;
constexpr uint32_t FUNDING_RATE_DECIMALS = 18;
constexpr uint32_t FUNDING_SF_DECIMALS = 3;
constexpr uint64_t SECONDS_PER_DAY = 86400;
constexpr uint16_t MAX_LIQUIDATION_ITERATION = 10;
constexpr I128 MIN_LONG_TRADING_EXPO_BPS = 100;
constexpr size_t MAX_ACTIONABLE_PENDING_ACTIONS = 20;
constexpr uint64_t REMOVE_BLOCKED_GRACE_PERIOD = 3600;
constexpr int32_t NO_POSITION_TICK = std::numeric_limits<int32_t>::min();

// 10^(FUNDING_RATE_DECIMALS - FUNDING_SF_DECIMALS)
constexpr I128 FUNDING_SF_SCALE = 1000000000000000LL;

} // namespace constants

// =============================================================================
// Protocol Actions
// =============================================================================

enum class ProtocolAction : uint8_t {
    NONE = 0,
    INITIALIZE = 1,
    INITIATE_DEPOSIT = 2,
    VALIDATE_DEPOSIT = 3,
    INITIATE_WITHDRAWAL = 4,
    VALIDATE_WITHDRAWAL = 5,
    INITIATE_OPEN_POSITION = 6,
    VALIDATE_OPEN_POSITION = 7,
    INITIATE_CLOSE_POSITION = 8,
    VALIDATE_CLOSE_POSITION = 9,
    LIQUIDATION = 10
};

const char* to_string(ProtocolAction action);

// =============================================================================
// Long Positions
// =============================================================================

// Generation-counted handle into the tick arena
struct PositionId {
    int32_t tick = constants::NO_POSITION_TICK;
    uint64_t tick_version = 0;
    uint64_t index = 0;

    bool operator==(const PositionId& other) const = default;
};

struct Position {
    bool validated = false;
    uint64_t timestamp = 0;
    Address user{};
    I128 amount = 0;        // collateral, X18
    I128 total_expo = 0;    // leveraged exposure, X18
};

struct TickData {
    I128 total_expo = 0;
    uint32_t total_pos = 0;
    int32_t liquidation_penalty = 0;  // in ticks
};

struct LiqTickInfo {
    uint32_t total_positions;
    I128 total_expo;
    I128 remaining_collateral;
    I128 tick_price;
    I128 price_without_penalty;
};

} // namespace tickvault

#endif // TICKVAULT_TYPES_HPP
