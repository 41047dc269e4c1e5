#ifndef TICKVAULT_ORACLE_HPP
#define TICKVAULT_ORACLE_HPP

#include <map>
#include <shared_mutex>
#include <vector>

#include "types.hpp"

namespace tickvault {

// =============================================================================
// Price Oracle Interface
// =============================================================================

// Opaque payload forwarded to the oracle (signed update, VAA, ...)
using PriceData = std::vector<uint8_t>;

struct PriceInfo {
    I128 price = 0;           // price used for the action, X18
    I128 neutral_price = 0;   // price without confidence adjustment
    uint64_t timestamp = 0;
};

class IPriceOracle {
public:
    virtual ~IPriceOracle() = default;

    // Price for `action` as of `timestamp`. The result is trusted once returned.
    // Called with the protocol's write lock held: must not call back into Protocol.
    virtual PriceInfo get_price(ProtocolAction action, uint64_t timestamp, const PriceData& data) = 0;
};

// =============================================================================
// ManualOracle - settable prices
//
// Returns the price recorded for the exact timestamp when one exists, the
// current price otherwise. Throws ProtocolError(INVALID_PRICE) when no usable
// price is set.
// =============================================================================

class ManualOracle : public IPriceOracle {
public:
    ManualOracle() = default;
    explicit ManualOracle(I128 price) : current_price_(price) {}

    // Non-copyable
    ManualOracle(const ManualOracle&) = delete;
    ManualOracle& operator=(const ManualOracle&) = delete;

    void set_price(I128 price);
    void set_price_at(uint64_t timestamp, I128 price);
    I128 current_price() const;

    PriceInfo get_price(ProtocolAction action, uint64_t timestamp, const PriceData& data) override;

private:
    mutable std::shared_mutex mutex_;
    I128 current_price_ = 0;
    std::map<uint64_t, I128> prices_at_;
};

} // namespace tickvault

#endif // TICKVAULT_ORACLE_HPP
