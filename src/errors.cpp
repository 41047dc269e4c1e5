// =============================================================================
// errors.cpp - Protocol error codes and exception type
// =============================================================================

#include "tickvault/errors.hpp"

#include <fmt/format.h>

namespace tickvault {

const char* to_string(Error code) {
    switch (code) {
        case Error::TIMESTAMP_TOO_OLD: return "TimestampTooOld";
        case Error::OUTDATED_TICK: return "OutdatedTick";
        case Error::VALIDATION_TOO_EARLY: return "ValidationTooEarly";
        case Error::INVALID_LIQUIDATION_PRICE: return "InvalidLiquidationPrice";
        case Error::LEVERAGE_TOO_LOW: return "LeverageTooLow";
        case Error::LEVERAGE_TOO_HIGH: return "LeverageTooHigh";
        case Error::ZERO_AMOUNT: return "ZeroAmount";
        case Error::LONG_POSITION_TOO_SMALL: return "LongPositionTooSmall";
        case Error::DEPOSIT_TOO_SMALL: return "DepositTooSmall";
        case Error::AMOUNT_TO_CLOSE_TOO_HIGH: return "AmountToCloseHigherThanPositionAmount";
        case Error::INVALID_ADDRESS_TO: return "InvalidAddressTo";
        case Error::INVALID_ADDRESS_VALIDATOR: return "InvalidAddressValidator";
        case Error::SECURITY_DEPOSIT_VALUE: return "SecurityDepositValue";
        case Error::ZERO_TOTAL_EXPO: return "ZeroTotalExpo";
        case Error::INVALID_PRICE: return "InvalidPrice";
        case Error::INVALID_CONFIG: return "InvalidConfig";
        case Error::INVALID_TICK: return "InvalidTick";
        case Error::IMBALANCE_LIMIT_REACHED: return "ImbalanceLimitReached";
        case Error::EMPTY_VAULT: return "EmptyVault";
        case Error::PENDING_ACTION: return "PendingAction";
        case Error::NO_PENDING_ACTION: return "NoPendingAction";
        case Error::QUEUE_EMPTY: return "QueueEmpty";
        case Error::INVALID_PENDING_ACTION: return "InvalidPendingAction";
        case Error::POSITION_NOT_FOUND: return "PositionNotFound";
        case Error::POSITION_NOT_VALIDATED: return "PositionNotValidated";
        case Error::NOT_INITIALIZED: return "NotInitialized";
        case Error::ALREADY_INITIALIZED: return "AlreadyInitialized";
        case Error::UNAUTHORIZED: return "Unauthorized";
        case Error::TRANSFER_FAILED: return "TransferFailed";
        case Error::ETHER_REFUND_FAILED: return "EtherRefundFailed";
        case Error::ARITHMETIC_OVERFLOW: return "ArithmeticOverflow";
        case Error::DIVISION_BY_ZERO: return "DivisionByZero";
    }
    return "Unknown";
}

ErrorKind kind_of(Error code) {
    switch (code) {
        case Error::TIMESTAMP_TOO_OLD:
        case Error::OUTDATED_TICK:
        case Error::VALIDATION_TOO_EARLY:
            return ErrorKind::STALENESS;
        case Error::PENDING_ACTION:
        case Error::NO_PENDING_ACTION:
        case Error::QUEUE_EMPTY:
        case Error::INVALID_PENDING_ACTION:
        case Error::POSITION_NOT_FOUND:
        case Error::POSITION_NOT_VALIDATED:
        case Error::NOT_INITIALIZED:
        case Error::ALREADY_INITIALIZED:
        case Error::IMBALANCE_LIMIT_REACHED:
        case Error::EMPTY_VAULT:
            return ErrorKind::STATE_CONFLICT;
        case Error::UNAUTHORIZED:
            return ErrorKind::AUTHORIZATION;
        case Error::TRANSFER_FAILED:
        case Error::ETHER_REFUND_FAILED:
            return ErrorKind::TRANSFER;
        case Error::ARITHMETIC_OVERFLOW:
        case Error::DIVISION_BY_ZERO:
            return ErrorKind::ARITHMETIC;
        default:
            return ErrorKind::INVALID_PARAMETERS;
    }
}

namespace {

std::string format_message(Error code, const std::string& detail, const ErrorContext& ctx) {
    std::string msg = fmt::format("{} ({})", to_string(code), static_cast<int32_t>(code));
    if (!detail.empty()) {
        msg += fmt::format(": {}", detail);
    }
    if (ctx.price) {
        msg += fmt::format(" [price={}]", x18::to_decimal_string(*ctx.price));
    }
    if (ctx.tick) {
        msg += fmt::format(" [tick={}]", *ctx.tick);
    }
    if (ctx.timestamp) {
        msg += fmt::format(" [timestamp={}]", *ctx.timestamp);
    }
    if (ctx.user) {
        msg += fmt::format(" [user={}]", addresses::to_hex(*ctx.user));
    }
    return msg;
}

} // namespace

ProtocolError::ProtocolError(Error code, const std::string& detail, ErrorContext context)
    : std::runtime_error(format_message(code, detail, context))
    , code_(code)
    , context_(std::move(context)) {}

} // namespace tickvault
