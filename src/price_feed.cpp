#include "price_feed.hpp"

#include <stdexcept>
#include <utility>

namespace betme {

ManualPriceFeed::ManualPriceFeed(std::string description)
    : description_(std::move(description)) {}

void ManualPriceFeed::publish(std::int64_t price, std::uint64_t updatedAt) {
    if (updatedAt == 0) {
        throw std::invalid_argument("price reading needs a timestamp");
    }
    if (updatedAt < latest_.updatedAt) {
        throw std::invalid_argument("price reading is older than the latest round");
    }
    latest_.price = price;
    latest_.updatedAt = updatedAt;
    latest_.round += 1;
}

PriceReading ManualPriceFeed::latestPrice() {
    return latest_;
}

} // namespace betme
