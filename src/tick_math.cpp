// =============================================================================
// tick_math.cpp - Price <-> tick conversion
// =============================================================================

#include "tickvault/tick_math.hpp"
#include "tickvault/errors.hpp"

#include <algorithm>
#include <cmath>

namespace tickvault {

namespace tick_math {

namespace {

constexpr long double TICK_BASE = 1.0001L;
const long double LN_TICK_BASE = std::log(TICK_BASE);

I128 raw_price_at_tick(int32_t tick) {
    // Long double keeps ~19 significant digits, well below the 1bp tick step
    long double price = std::pow(TICK_BASE, static_cast<long double>(tick)) *
                        static_cast<long double>(X18_ONE);
    return static_cast<I128>(std::floor(price));
}

} // namespace

I128 min_price() {
    static const I128 value = raw_price_at_tick(MIN_TICK);
    return value;
}

I128 max_price() {
    static const I128 value = raw_price_at_tick(MAX_TICK);
    return value;
}

I128 price_at_tick(int32_t tick) {
    if (tick < MIN_TICK || tick > MAX_TICK) {
        throw ProtocolError(Error::INVALID_TICK, "tick out of range", {.tick = tick});
    }
    return raw_price_at_tick(tick);
}

int32_t tick_at_price(I128 price) {
    if (price < min_price() || price > max_price()) {
        throw ProtocolError(Error::INVALID_PRICE, "price out of tick range", {.price = price});
    }

    long double ratio = static_cast<long double>(price) / static_cast<long double>(X18_ONE);
    long double estimate = std::floor(std::log(ratio) / LN_TICK_BASE);
    int32_t tick = static_cast<int32_t>(std::clamp(estimate,
                                                   static_cast<long double>(MIN_TICK),
                                                   static_cast<long double>(MAX_TICK)));

    // Correct the floating-point estimate so price(tick) <= price < price(tick + 1)
    while (tick < MAX_TICK && raw_price_at_tick(tick + 1) <= price) {
        ++tick;
    }
    while (tick > MIN_TICK && raw_price_at_tick(tick) > price) {
        --tick;
    }
    return tick;
}

int32_t tick_at_price_clamped(I128 price) {
    if (price < min_price()) return MIN_TICK;
    if (price > max_price()) return MAX_TICK;
    return tick_at_price(price);
}

} // namespace tick_math

} // namespace tickvault
