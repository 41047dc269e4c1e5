#ifndef TICKVAULT_ERRORS_HPP
#define TICKVAULT_ERRORS_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include "types.hpp"

namespace tickvault {

// =============================================================================
// Error Codes
// =============================================================================

enum class Error : int32_t {
    // Staleness
    TIMESTAMP_TOO_OLD = -1,
    OUTDATED_TICK = -2,
    VALIDATION_TOO_EARLY = -3,

    // Invalid parameters
    INVALID_LIQUIDATION_PRICE = -10,
    LEVERAGE_TOO_LOW = -11,
    LEVERAGE_TOO_HIGH = -12,
    ZERO_AMOUNT = -13,
    LONG_POSITION_TOO_SMALL = -14,
    DEPOSIT_TOO_SMALL = -15,
    AMOUNT_TO_CLOSE_TOO_HIGH = -16,
    INVALID_ADDRESS_TO = -17,
    INVALID_ADDRESS_VALIDATOR = -18,
    SECURITY_DEPOSIT_VALUE = -19,
    ZERO_TOTAL_EXPO = -20,
    INVALID_PRICE = -21,
    INVALID_CONFIG = -22,
    INVALID_TICK = -23,

    // Imbalance
    IMBALANCE_LIMIT_REACHED = -30,
    EMPTY_VAULT = -31,

    // State conflicts
    PENDING_ACTION = -40,
    NO_PENDING_ACTION = -41,
    QUEUE_EMPTY = -42,
    INVALID_PENDING_ACTION = -43,
    POSITION_NOT_FOUND = -44,
    POSITION_NOT_VALIDATED = -45,
    NOT_INITIALIZED = -46,
    ALREADY_INITIALIZED = -47,

    // Authorization / timing
    UNAUTHORIZED = -50,

    // Transfer failures
    TRANSFER_FAILED = -60,
    ETHER_REFUND_FAILED = -61,

    // Arithmetic
    ARITHMETIC_OVERFLOW = -70,
    DIVISION_BY_ZERO = -71
};

const char* to_string(Error code);

// Broad error category, for callers deciding whether to retry, adjust or wait
enum class ErrorKind : uint8_t {
    STALENESS,
    INVALID_PARAMETERS,
    STATE_CONFLICT,
    AUTHORIZATION,
    TRANSFER,
    ARITHMETIC
};

ErrorKind kind_of(Error code);

// =============================================================================
// Protocol Error (aborts the whole transition)
// =============================================================================

struct ErrorContext {
    std::optional<I128> price;
    std::optional<int32_t> tick;
    std::optional<uint64_t> timestamp;
    std::optional<Address> user;
};

class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(Error code, const std::string& detail = {}, ErrorContext context = {});

    Error code() const noexcept { return code_; }
    ErrorKind kind() const noexcept { return kind_of(code_); }
    const ErrorContext& context() const noexcept { return context_; }

private:
    Error code_;
    ErrorContext context_;
};

} // namespace tickvault

#endif // TICKVAULT_ERRORS_HPP
