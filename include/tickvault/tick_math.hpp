#ifndef TICKVAULT_TICK_MATH_HPP
#define TICKVAULT_TICK_MATH_HPP

#include <cstdint>

#include "types.hpp"

namespace tickvault {

// =============================================================================
// Tick Math Utilities
//
// price(tick) = 1.0001^tick * 1e18 (X18). Geometric spacing of 1 basis point
// per tick. MAX_TICK is the largest tick whose price still fits in I128 with
// headroom for products.
// =============================================================================

namespace tick_math {

constexpr int32_t MIN_TICK = -322378;
constexpr int32_t MAX_TICK = 460000;

// Price at MIN_TICK / MAX_TICK
I128 min_price();
I128 max_price();

// Throws ProtocolError(INVALID_TICK) for ticks outside [MIN_TICK, MAX_TICK]
I128 price_at_tick(int32_t tick);

// Largest tick whose price is <= price.
// Throws ProtocolError(INVALID_PRICE) outside [min_price(), max_price()]
int32_t tick_at_price(I128 price);

// Like tick_at_price but clamps out-of-range prices to MIN_TICK / MAX_TICK
int32_t tick_at_price_clamped(I128 price);

// Usable ticks are multiples of the tick spacing within [MIN_TICK, MAX_TICK]
inline int32_t min_usable_tick(int32_t tick_spacing) {
    return (MIN_TICK / tick_spacing) * tick_spacing;
}

inline int32_t max_usable_tick(int32_t tick_spacing) {
    return (MAX_TICK / tick_spacing) * tick_spacing;
}

// Round toward negative infinity to a multiple of tick_spacing
inline int32_t round_down(int32_t tick, int32_t tick_spacing) {
    if (tick < 0 && tick % tick_spacing != 0) {
        return (tick / tick_spacing - 1) * tick_spacing;
    }
    return (tick / tick_spacing) * tick_spacing;
}

} // namespace tick_math

} // namespace tickvault

#endif // TICKVAULT_TICK_MATH_HPP
