#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace betme {

struct PriceReading {
    std::int64_t price = 0;
    std::uint64_t updatedAt = 0; // unix seconds, 0 means the feed never reported
    std::uint64_t round = 0;
};

class PriceFeed {
public:
    virtual ~PriceFeed() = default;
    virtual PriceReading latestPrice() = 0;
    virtual std::string description() const = 0;
};

using PriceFeedPtr = std::shared_ptr<PriceFeed>;

// Feed whose readings are published by hand (console input, tests).
class ManualPriceFeed : public PriceFeed {
public:
    explicit ManualPriceFeed(std::string description = "manual");

    void publish(std::int64_t price, std::uint64_t updatedAt);
    PriceReading latestPrice() override;
    std::string description() const override { return description_; }

private:
    std::string description_;
    PriceReading latest_;
};

} // namespace betme
