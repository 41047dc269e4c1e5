#ifndef TICKVAULT_TICK_BITMAP_HPP
#define TICKVAULT_TICK_BITMAP_HPP

#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

namespace tickvault {

// =============================================================================
// Tick Bitmap
//
// Dense bitset over usable ticks with summary levels on top: bit i of level
// n+1 is set when word i of level n is non-zero. The top level is one word,
// so "highest set bit <= x" touches one word per level.
// =============================================================================

class TickBitmap {
public:
    static constexpr size_t NOT_FOUND = std::numeric_limits<size_t>::max();

    TickBitmap() = default;
    explicit TickBitmap(size_t size);

    size_t size() const { return size_; }

    void set(size_t index);
    void unset(size_t index);
    bool is_set(size_t index) const;

    // Highest set index <= start, or NOT_FOUND
    size_t find_last_set(size_t start) const;

    bool empty() const;

private:
    size_t find_last_set_in_level(size_t level, size_t start) const;

    size_t size_ = 0;
    std::vector<std::vector<uint64_t>> levels_;
};

// =============================================================================
// Tick <-> bitmap index
//
// index = (tick - min_usable_tick) / tick_spacing. Only usable ticks (multiples
// of the spacing inside [min_usable_tick, max_usable_tick]) map; anything else
// throws ProtocolError(INVALID_TICK).
// =============================================================================

size_t tick_to_bitmap_index(int32_t tick, int32_t tick_spacing);
int32_t bitmap_index_to_tick(size_t index, int32_t tick_spacing);

// Number of usable ticks for a spacing
size_t bitmap_size(int32_t tick_spacing);

} // namespace tickvault

#endif // TICKVAULT_TICK_BITMAP_HPP
