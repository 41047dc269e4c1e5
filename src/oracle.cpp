// =============================================================================
// oracle.cpp - Manual price source
// =============================================================================

#include "tickvault/oracle.hpp"
#include "tickvault/errors.hpp"

#include <mutex>

namespace tickvault {

void ManualOracle::set_price(I128 price) {
    std::unique_lock lock(mutex_);
    current_price_ = price;
}

void ManualOracle::set_price_at(uint64_t timestamp, I128 price) {
    std::unique_lock lock(mutex_);
    prices_at_[timestamp] = price;
}

I128 ManualOracle::current_price() const {
    std::shared_lock lock(mutex_);
    return current_price_;
}

PriceInfo ManualOracle::get_price(ProtocolAction action, uint64_t timestamp, const PriceData& data) {
    std::shared_lock lock(mutex_);

    I128 price = current_price_;
    auto it = prices_at_.find(timestamp);
    if (it != prices_at_.end()) {
        price = it->second;
    }
    if (price <= 0) {
        throw ProtocolError(Error::INVALID_PRICE,
                            std::string("no price for ") + to_string(action),
                            {.price = price, .timestamp = timestamp});
    }
    return PriceInfo{price, price, timestamp};
}

} // namespace tickvault
