// =============================================================================
// liquidation_multiplier.cpp - Funding-adjusted liquidation price conversion
// =============================================================================

#include "tickvault/liquidation_multiplier.hpp"
#include "tickvault/errors.hpp"

namespace tickvault {

namespace multiplier {

namespace {

I128 narrow(const Uint512& v, const char* where) {
    U128 raw = huge_uint::to_u128(v);
    if (raw > static_cast<U128>(I128_MAX)) {
        throw ProtocolError(Error::ARITHMETIC_OVERFLOW, where);
    }
    return static_cast<I128>(raw);
}

void require_non_negative(I128 v, const char* where) {
    if (v < 0) {
        throw ProtocolError(Error::INVALID_PRICE, where, {.price = v});
    }
}

} // namespace

U256 fixed_precision_multiplier(I128 asset_price, I128 long_trading_expo,
                                const Uint512& accumulator) {
    if (accumulator.is_zero() || long_trading_expo <= 0) {
        return U256(FIXED_PRECISION);
    }
    require_non_negative(asset_price, "multiplier: negative asset price");

    Uint512 numerator = huge_uint::mul(
        huge_uint::mul(U256(static_cast<U128>(asset_price)), U256(static_cast<U128>(long_trading_expo))),
        FIXED_PRECISION);
    Uint512 result = huge_uint::div(numerator, accumulator);
    if (!result.hi.is_zero()) {
        throw ProtocolError(Error::ARITHMETIC_OVERFLOW, "multiplier does not fit 256 bits");
    }
    return result.lo;
}

I128 adjust_price(I128 unadjusted_price, const U256& multiplier) {
    require_non_negative(unadjusted_price, "adjust_price: negative price");
    Uint512 product = huge_uint::mul(U256(static_cast<U128>(unadjusted_price)), multiplier);
    return narrow(huge_uint::div(product, Uint512(U256(FIXED_PRECISION))), "adjust_price");
}

I128 adjust_price(I128 unadjusted_price, I128 asset_price, I128 long_trading_expo,
                  const Uint512& accumulator) {
    return adjust_price(unadjusted_price,
                        fixed_precision_multiplier(asset_price, long_trading_expo, accumulator));
}

I128 unadjust_price(I128 price, I128 asset_price, I128 long_trading_expo,
                    const Uint512& accumulator) {
    if (accumulator.is_zero() || long_trading_expo <= 0) {
        return price;
    }
    require_non_negative(price, "unadjust_price: negative price");
    require_non_negative(asset_price, "unadjust_price: negative asset price");

    Uint512 numerator = huge_uint::mul(accumulator, static_cast<U128>(price));
    Uint512 denominator(mul_u128(static_cast<U128>(asset_price), static_cast<U128>(long_trading_expo)));
    return narrow(huge_uint::div(numerator, denominator), "unadjust_price");
}

Uint512 accumulator_term(I128 unadjusted_price, I128 total_expo) {
    require_non_negative(unadjusted_price, "accumulator_term: negative price");
    if (total_expo < 0) {
        throw ProtocolError(Error::ARITHMETIC_OVERFLOW, "accumulator_term: negative expo");
    }
    return Uint512(mul_u128(static_cast<U128>(unadjusted_price), static_cast<U128>(total_expo)));
}

} // namespace multiplier

} // namespace tickvault
