// =============================================================================
// types.cpp - Address and X18 formatting helpers
// =============================================================================

#include "tickvault/types.hpp"

#include <algorithm>
#include <stdexcept>

namespace tickvault {

namespace addresses {

std::string to_hex(const Address& addr) {
    static constexpr char DIGITS[] = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(2 + addr.size() * 2);
    for (uint8_t b : addr) {
        out.push_back(DIGITS[b >> 4]);
        out.push_back(DIGITS[b & 0x0F]);
    }
    return out;
}

} // namespace addresses

namespace x18 {

namespace {

constexpr size_t DECIMALS = 18;

void push_digit(U128& acc, char c, std::string_view text) {
    if (c < '0' || c > '9') {
        throw std::invalid_argument("x18: invalid digit in '" + std::string(text) + "'");
    }
    const U128 limit = static_cast<U128>(I128_MAX) / 10;
    if (acc > limit) {
        throw std::invalid_argument("x18: value out of range '" + std::string(text) + "'");
    }
    acc = acc * 10 + static_cast<U128>(c - '0');
    if (acc > static_cast<U128>(I128_MAX)) {
        throw std::invalid_argument("x18: value out of range '" + std::string(text) + "'");
    }
}

} // namespace

I128 from_string(std::string_view text) {
    if (text.empty()) {
        throw std::invalid_argument("x18: empty string");
    }

    bool negative = false;
    size_t pos = 0;
    if (text[0] == '-' || text[0] == '+') {
        negative = text[0] == '-';
        pos = 1;
    }

    U128 acc = 0;
    size_t fraction_digits = 0;
    bool seen_dot = false;
    bool seen_digit = false;

    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c == '_') continue;
        if (c == '.') {
            if (seen_dot) throw std::invalid_argument("x18: multiple dots in '" + std::string(text) + "'");
            seen_dot = true;
            continue;
        }
        if (seen_dot) {
            if (fraction_digits == DECIMALS) {
                throw std::invalid_argument("x18: more than 18 decimals in '" + std::string(text) + "'");
            }
            ++fraction_digits;
        }
        push_digit(acc, c, text);
        seen_digit = true;
    }

    if (!seen_digit) {
        throw std::invalid_argument("x18: no digits in '" + std::string(text) + "'");
    }

    for (; fraction_digits < DECIMALS; ++fraction_digits) {
        push_digit(acc, '0', text);
    }

    I128 value = static_cast<I128>(acc);
    return negative ? -value : value;
}

std::string to_string(I128 v) {
    if (v == 0) return "0";

    bool negative = v < 0;
    // Magnitude via unsigned to survive I128 minimum
    U128 mag = negative ? U128(0) - static_cast<U128>(v) : static_cast<U128>(v);

    std::string out;
    while (mag > 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(mag % 10)));
        mag /= 10;
    }
    if (negative) out.push_back('-');
    std::reverse(out.begin(), out.end());
    return out;
}

std::string to_decimal_string(I128 v) {
    bool negative = v < 0;
    U128 mag = negative ? U128(0) - static_cast<U128>(v) : static_cast<U128>(v);
    U128 one = static_cast<U128>(X18_ONE);

    std::string integer = to_string(static_cast<I128>(mag / one));
    std::string fraction = to_string(static_cast<I128>(mag % one));
    fraction.insert(0, DECIMALS - fraction.size(), '0');
    while (!fraction.empty() && fraction.back() == '0') fraction.pop_back();

    std::string out = negative ? "-" : "";
    out += integer;
    if (!fraction.empty()) {
        out += ".";
        out += fraction;
    }
    return out;
}

} // namespace x18

const char* to_string(ProtocolAction action) {
    switch (action) {
        case ProtocolAction::NONE: return "None";
        case ProtocolAction::INITIALIZE: return "Initialize";
        case ProtocolAction::INITIATE_DEPOSIT: return "InitiateDeposit";
        case ProtocolAction::VALIDATE_DEPOSIT: return "ValidateDeposit";
        case ProtocolAction::INITIATE_WITHDRAWAL: return "InitiateWithdrawal";
        case ProtocolAction::VALIDATE_WITHDRAWAL: return "ValidateWithdrawal";
        case ProtocolAction::INITIATE_OPEN_POSITION: return "InitiateOpenPosition";
        case ProtocolAction::VALIDATE_OPEN_POSITION: return "ValidateOpenPosition";
        case ProtocolAction::INITIATE_CLOSE_POSITION: return "InitiateClosePosition";
        case ProtocolAction::VALIDATE_CLOSE_POSITION: return "ValidateClosePosition";
        case ProtocolAction::LIQUIDATION: return "Liquidation";
    }
    return "Unknown";
}

} // namespace tickvault
