// =============================================================================
// tick_bitmap.cpp - Hierarchical bitset of populated ticks
// =============================================================================

#include "tickvault/tick_bitmap.hpp"
#include "tickvault/errors.hpp"
#include "tickvault/tick_math.hpp"

#include <bit>

namespace tickvault {

namespace {

constexpr size_t BITS_PER_WORD = 64;
constexpr size_t WORD_SHIFT = 6;
constexpr size_t WORD_MASK = BITS_PER_WORD - 1;

size_t words_for(size_t bits) {
    return (bits + WORD_MASK) >> WORD_SHIFT;
}

// Bits at or below `bit` within its word
uint64_t mask_at_or_below(size_t bit) {
    const size_t remain = bit & WORD_MASK;
    return remain == WORD_MASK ? ~0ULL : (1ULL << (remain + 1)) - 1;
}

size_t msb(uint64_t word) {
    return WORD_MASK - static_cast<size_t>(std::countl_zero(word));
}

} // namespace

TickBitmap::TickBitmap(size_t size) : size_(size) {
    size_t bits = size == 0 ? 1 : size;
    do {
        size_t words = words_for(bits);
        levels_.emplace_back(words, 0);
        bits = words;
    } while (bits > 1);
}

void TickBitmap::set(size_t index) {
    if (index >= size_) {
        throw ProtocolError(Error::INVALID_TICK, "bitmap index out of range");
    }
    for (auto& level : levels_) {
        const size_t word_idx = index >> WORD_SHIFT;
        const bool was_empty = level[word_idx] == 0;
        level[word_idx] |= 1ULL << (index & WORD_MASK);
        if (!was_empty) break;
        index = word_idx;
    }
}

void TickBitmap::unset(size_t index) {
    if (index >= size_) {
        throw ProtocolError(Error::INVALID_TICK, "bitmap index out of range");
    }
    for (auto& level : levels_) {
        const size_t word_idx = index >> WORD_SHIFT;
        level[word_idx] &= ~(1ULL << (index & WORD_MASK));
        if (level[word_idx] != 0) break;
        index = word_idx;
    }
}

bool TickBitmap::is_set(size_t index) const {
    if (index >= size_) return false;
    return (levels_[0][index >> WORD_SHIFT] >> (index & WORD_MASK)) & 1;
}

bool TickBitmap::empty() const {
    return levels_.empty() || levels_.back()[0] == 0;
}

size_t TickBitmap::find_last_set(size_t start) const {
    if (size_ == 0) return NOT_FOUND;
    if (start >= size_) start = size_ - 1;
    return find_last_set_in_level(0, start);
}

size_t TickBitmap::find_last_set_in_level(size_t level, size_t start) const {
    const auto& words = levels_[level];
    const size_t word_idx = start >> WORD_SHIFT;

    if (const uint64_t word = words[word_idx] & mask_at_or_below(start)) {
        return (word_idx << WORD_SHIFT) + msb(word);
    }
    if (word_idx == 0 || level + 1 == levels_.size()) {
        return NOT_FOUND;
    }

    // The summary level points at the closest non-empty word below this one
    const size_t below = find_last_set_in_level(level + 1, word_idx - 1);
    if (below == NOT_FOUND) return NOT_FOUND;
    return (below << WORD_SHIFT) + msb(words[below]);
}

// =============================================================================
// Tick <-> index
// =============================================================================

size_t tick_to_bitmap_index(int32_t tick, int32_t tick_spacing) {
    int32_t min_tick = tick_math::min_usable_tick(tick_spacing);
    int32_t max_tick = tick_math::max_usable_tick(tick_spacing);
    if (tick < min_tick || tick > max_tick || tick % tick_spacing != 0) {
        throw ProtocolError(Error::INVALID_TICK, "tick is not usable", {.tick = tick});
    }
    return static_cast<size_t>((static_cast<int64_t>(tick) - min_tick) / tick_spacing);
}

int32_t bitmap_index_to_tick(size_t index, int32_t tick_spacing) {
    if (index >= bitmap_size(tick_spacing)) {
        throw ProtocolError(Error::INVALID_TICK, "bitmap index out of range");
    }
    return tick_math::min_usable_tick(tick_spacing) +
           static_cast<int32_t>(index) * tick_spacing;
}

size_t bitmap_size(int32_t tick_spacing) {
    int64_t span = static_cast<int64_t>(tick_math::max_usable_tick(tick_spacing)) -
                   tick_math::min_usable_tick(tick_spacing);
    return static_cast<size_t>(span / tick_spacing) + 1;
}

} // namespace tickvault
