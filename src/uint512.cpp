// =============================================================================
// uint512.cpp - Wide unsigned arithmetic for the liquidation accumulator
// =============================================================================

#include "tickvault/uint512.hpp"
#include "tickvault/errors.hpp"

#include <algorithm>

namespace tickvault {

namespace {

constexpr size_t LIMBS = 8;  // 8 x 64 = 512 bits
using Limbs = std::array<uint64_t, LIMBS>;

constexpr U128 MASK64 = (U128(1) << 64) - 1;

Limbs to_limbs(const Uint512& v) {
    return {
        static_cast<uint64_t>(v.lo.lo & MASK64), static_cast<uint64_t>(v.lo.lo >> 64),
        static_cast<uint64_t>(v.lo.hi & MASK64), static_cast<uint64_t>(v.lo.hi >> 64),
        static_cast<uint64_t>(v.hi.lo & MASK64), static_cast<uint64_t>(v.hi.lo >> 64),
        static_cast<uint64_t>(v.hi.hi & MASK64), static_cast<uint64_t>(v.hi.hi >> 64),
    };
}

Uint512 from_limbs(const Limbs& l) {
    auto join = [&](size_t i) { return static_cast<U128>(l[i]) | (static_cast<U128>(l[i + 1]) << 64); };
    return Uint512(U256(join(0), join(2)), U256(join(4), join(6)));
}

int cmp_limbs(const Limbs& a, const Limbs& b) {
    for (size_t i = LIMBS; i-- > 0;) {
        if (a[i] != b[i]) return a[i] < b[i] ? -1 : 1;
    }
    return 0;
}

// a -= b, returns borrow out
uint64_t sub_limbs(Limbs& a, const Limbs& b) {
    uint64_t borrow = 0;
    for (size_t i = 0; i < LIMBS; ++i) {
        U128 lhs = static_cast<U128>(a[i]);
        U128 rhs = static_cast<U128>(b[i]) + borrow;
        if (lhs < rhs) {
            a[i] = static_cast<uint64_t>((lhs + (U128(1) << 64)) - rhs);
            borrow = 1;
        } else {
            a[i] = static_cast<uint64_t>(lhs - rhs);
            borrow = 0;
        }
    }
    return borrow;
}

// a <<= 1, returns the bit shifted out
uint64_t shl1_limbs(Limbs& a) {
    uint64_t carry = 0;
    for (size_t i = 0; i < LIMBS; ++i) {
        uint64_t next = a[i] >> 63;
        a[i] = (a[i] << 1) | carry;
        carry = next;
    }
    return carry;
}

int bit_length(const Limbs& a) {
    for (size_t i = LIMBS; i-- > 0;) {
        if (a[i] != 0) {
            int bits = 0;
            uint64_t w = a[i];
            while (w != 0) { w >>= 1; ++bits; }
            return static_cast<int>(i * 64) + bits;
        }
    }
    return 0;
}

[[noreturn]] void overflow(const char* where) {
    throw ProtocolError(Error::ARITHMETIC_OVERFLOW, where);
}

I128 abs128(I128 x) { return x < 0 ? -x : x; }

} // namespace

// =============================================================================
// U256
// =============================================================================

U256 mul_u128(U128 a, U128 b) {
    // Split into 64-bit halves to avoid overflow
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    // Cross products
    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    // Accumulate with carry
    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);
    U128 carry = mid >> 64;

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + carry;
    return result;
}

// =============================================================================
// Uint512
// =============================================================================

namespace huge_uint {

Uint512 add(const Uint512& a, const Uint512& b) {
    Limbs x = to_limbs(a);
    Limbs y = to_limbs(b);
    uint64_t carry = 0;
    for (size_t i = 0; i < LIMBS; ++i) {
        U128 sum = static_cast<U128>(x[i]) + y[i] + carry;
        x[i] = static_cast<uint64_t>(sum & MASK64);
        carry = static_cast<uint64_t>(sum >> 64);
    }
    if (carry != 0) overflow("huge_uint::add");
    return from_limbs(x);
}

Uint512 sub(const Uint512& a, const Uint512& b) {
    Limbs x = to_limbs(a);
    if (sub_limbs(x, to_limbs(b)) != 0) overflow("huge_uint::sub underflow");
    return from_limbs(x);
}

Uint512 mul(const U256& a, const U256& b) {
    // Schoolbook on U128 limbs: (a.hi*2^128 + a.lo) * (b.hi*2^128 + b.lo)
    U256 ll = mul_u128(a.lo, b.lo);
    U256 lh = mul_u128(a.lo, b.hi);
    U256 hl = mul_u128(a.hi, b.lo);
    U256 hh = mul_u128(a.hi, b.hi);

    Uint512 result(ll, hh);
    // lh and hl are shifted by 128 bits
    Uint512 lh_shifted(U256(0, lh.lo), U256(lh.hi, 0));
    Uint512 hl_shifted(U256(0, hl.lo), U256(hl.hi, 0));
    result = add(result, lh_shifted);
    result = add(result, hl_shifted);
    return result;
}

Uint512 mul(const Uint512& a, U128 b) {
    Limbs x = to_limbs(a);
    uint64_t b_lo = static_cast<uint64_t>(b & MASK64);
    uint64_t b_hi = static_cast<uint64_t>(b >> 64);

    std::array<uint64_t, LIMBS + 2> acc{};
    for (size_t i = 0; i < LIMBS; ++i) {
        U128 carry = 0;
        for (size_t j = 0; j < 2; ++j) {
            uint64_t bj = j == 0 ? b_lo : b_hi;
            U128 cur = static_cast<U128>(x[i]) * bj + acc[i + j] + carry;
            acc[i + j] = static_cast<uint64_t>(cur & MASK64);
            carry = cur >> 64;
        }
        size_t k = i + 2;
        while (carry != 0 && k < acc.size()) {
            U128 cur = static_cast<U128>(acc[k]) + carry;
            acc[k] = static_cast<uint64_t>(cur & MASK64);
            carry = cur >> 64;
            ++k;
        }
    }
    if (acc[LIMBS] != 0 || acc[LIMBS + 1] != 0) overflow("huge_uint::mul");

    Limbs out{};
    std::copy_n(acc.begin(), LIMBS, out.begin());
    return from_limbs(out);
}

Uint512 div(const Uint512& num, const Uint512& den) {
    if (den.is_zero()) {
        throw ProtocolError(Error::DIVISION_BY_ZERO, "huge_uint::div");
    }

    Limbs n = to_limbs(num);
    Limbs d = to_limbs(den);
    if (cmp_limbs(n, d) < 0) return Uint512();

    // Binary long division
    Limbs quot{};
    Limbs rem{};
    for (int i = bit_length(n) - 1; i >= 0; --i) {
        uint64_t out = shl1_limbs(rem);
        rem[0] |= (n[static_cast<size_t>(i) / 64] >> (static_cast<size_t>(i) % 64)) & 1;
        if (out != 0 || cmp_limbs(rem, d) >= 0) {
            sub_limbs(rem, d);
            quot[static_cast<size_t>(i) / 64] |= uint64_t(1) << (static_cast<size_t>(i) % 64);
        }
    }
    return from_limbs(quot);
}

int cmp(const Uint512& a, const Uint512& b) {
    return cmp_limbs(to_limbs(a), to_limbs(b));
}

U128 to_u128(const Uint512& v) {
    if (v.lo.hi != 0 || !v.hi.is_zero()) overflow("huge_uint::to_u128");
    return v.lo.lo;
}

std::string to_string(const Uint512& v) {
    if (v.is_zero()) return "0";
    std::string out;
    Uint512 cur = v;
    const Uint512 ten(U256(10));
    while (!cur.is_zero()) {
        Uint512 q = div(cur, ten);
        Uint512 r = sub(cur, mul(q, 10));
        out.push_back(static_cast<char>('0' + static_cast<int>(r.lo.lo)));
        cur = q;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

} // namespace huge_uint

// =============================================================================
// mul_div
// =============================================================================

I128 mul_div(I128 a, I128 b, I128 denom) {
    if (denom == 0) {
        throw ProtocolError(Error::DIVISION_BY_ZERO, "mul_div");
    }

    bool neg = (a < 0) ^ (b < 0) ^ (denom < 0);
    U128 ua = static_cast<U128>(abs128(a));
    U128 ub = static_cast<U128>(abs128(b));
    U128 ud = static_cast<U128>(abs128(denom));

    // 256-bit product, then divide
    Uint512 product(mul_u128(ua, ub));
    U128 result = huge_uint::to_u128(huge_uint::div(product, Uint512(U256(ud))));
    if (result > static_cast<U128>(I128_MAX)) overflow("mul_div");

    return neg ? -static_cast<I128>(result) : static_cast<I128>(result);
}

I128 mul_div_up(I128 a, I128 b, I128 denom) {
    if (a < 0 || b < 0 || denom < 0) {
        throw ProtocolError(Error::ARITHMETIC_OVERFLOW, "mul_div_up: negative operand");
    }
    if (denom == 0) {
        throw ProtocolError(Error::DIVISION_BY_ZERO, "mul_div_up");
    }

    Uint512 product(mul_u128(static_cast<U128>(a), static_cast<U128>(b)));
    Uint512 den(U256(static_cast<U128>(denom)));
    Uint512 quot = huge_uint::div(product, den);
    Uint512 back = huge_uint::mul(quot, static_cast<U128>(denom));
    if (!(back == product)) {
        quot = huge_uint::add(quot, Uint512(U256(1)));
    }
    U128 result = huge_uint::to_u128(quot);
    if (result > static_cast<U128>(I128_MAX)) overflow("mul_div_up");
    return static_cast<I128>(result);
}

} // namespace tickvault
