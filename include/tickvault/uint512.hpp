#ifndef TICKVAULT_UINT512_HPP
#define TICKVAULT_UINT512_HPP

#include <array>
#include <cstdint>

#include "types.hpp"

namespace tickvault {

// =============================================================================
// 256-bit Unsigned Integer (two U128 limbs)
// =============================================================================

struct U256 {
    U128 lo;  // Low 128 bits
    U128 hi;  // High 128 bits

    constexpr U256() : lo(0), hi(0) {}
    constexpr U256(U128 l) : lo(l), hi(0) {}
    constexpr U256(U128 l, U128 h) : lo(l), hi(h) {}

    bool operator==(const U256& other) const {
        return lo == other.lo && hi == other.hi;
    }
    bool operator<(const U256& other) const {
        return hi < other.hi || (hi == other.hi && lo < other.lo);
    }
    bool is_zero() const { return lo == 0 && hi == 0; }
};

// Multiply two U128 values to produce U256
U256 mul_u128(U128 a, U128 b);

// =============================================================================
// 512-bit Unsigned Integer (HugeUint, two U256 limbs)
// =============================================================================

struct Uint512 {
    U256 lo;
    U256 hi;

    constexpr Uint512() = default;
    constexpr Uint512(U256 l) : lo(l), hi() {}
    constexpr Uint512(U256 l, U256 h) : lo(l), hi(h) {}

    bool operator==(const Uint512& other) const {
        return lo == other.lo && hi == other.hi;
    }
    bool is_zero() const { return lo.is_zero() && hi.is_zero(); }
};

namespace huge_uint {

// All operations throw ProtocolError(ARITHMETIC_OVERFLOW / DIVISION_BY_ZERO)
// instead of wrapping.

Uint512 add(const Uint512& a, const Uint512& b);
Uint512 sub(const Uint512& a, const Uint512& b);

Uint512 mul(const U256& a, const U256& b);
Uint512 mul(const Uint512& a, U128 b);

// Floor division
Uint512 div(const Uint512& num, const Uint512& den);

// -1, 0, 1
int cmp(const Uint512& a, const Uint512& b);

// Narrowing, throws when the value does not fit
U128 to_u128(const Uint512& v);

std::string to_string(const Uint512& v);

} // namespace huge_uint

// =============================================================================
// Safe mul_div with 256-bit intermediate (signed, truncating toward zero)
// =============================================================================

I128 mul_div(I128 a, I128 b, I128 denom);

// Non-negative operands, rounds the quotient up
I128 mul_div_up(I128 a, I128 b, I128 denom);

} // namespace tickvault

#endif // TICKVAULT_UINT512_HPP
