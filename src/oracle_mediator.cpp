#include "oracle_mediator.hpp"

#include "errors.hpp"

#include <limits>
#include <memory>
#include <string>
#include <utility>

namespace betme {

namespace {

void validateTerms(const PriceFeedPtr& feed, const OptionTerms& terms, std::uint64_t now) {
    if (!feed) {
        throw ValidationError("Price feed is required");
    }
    if (terms.buyer.empty()) {
        throw ValidationError("Buyer is required");
    }
    if (terms.seller.empty()) {
        throw ValidationError("Seller is required");
    }
    if (terms.expiration == 0) {
        throw ValidationError("Expiration is required");
    }
    if (terms.expiration <= now) {
        throw ValidationError("Expiration must be in the future");
    }
    if (terms.heartbeat && *terms.heartbeat == 0) {
        throw ValidationError("Heartbeat must be positive when set");
    }
}

} // namespace

const char* optionTypeName(OptionType type) {
    return type == OptionType::PUT ? "put" : "call";
}

std::optional<OptionType> parseOptionType(const std::string& text) {
    if (text == "put" || text == "PUT") {
        return OptionType::PUT;
    }
    if (text == "call" || text == "CALL") {
        return OptionType::CALL;
    }
    return std::nullopt;
}

bool readingIsStale(const PriceReading& reading, std::uint64_t heartbeat, std::uint64_t now) {
    if (reading.updatedAt > std::numeric_limits<std::uint64_t>::max() - heartbeat) {
        return false;
    }
    return reading.updatedAt + heartbeat <= now;
}

void requireFreshReading(const PriceReading& reading,
                         const std::optional<std::uint64_t>& heartbeat,
                         std::uint64_t now) {
    if (reading.updatedAt == 0) {
        throw ValidationError("Price feed has not reported yet");
    }
    if (heartbeat && readingIsStale(reading, *heartbeat, now)) {
        throw ValidationError("Price feed is stale");
    }
}

bool strikeConsistent(const OptionTerms& terms, std::int64_t livePrice) {
    if (terms.type == OptionType::PUT) {
        return terms.strikePrice >= livePrice;
    }
    return terms.strikePrice <= livePrice;
}

std::optional<Identity> evaluateResolution(const OptionTerms& terms,
                                           std::uint64_t now,
                                           const PriceReading& reading) {
    // Time decay favours the seller once the option has expired.
    if (now > terms.expiration) {
        return terms.seller;
    }
    if (terms.type == OptionType::PUT) {
        if (reading.price <= terms.strikePrice) {
            return terms.buyer;
        }
        return std::nullopt;
    }
    if (reading.price >= terms.strikePrice) {
        return terms.seller;
    }
    return std::nullopt;
}

OracleMediator::OracleMediator(ValueLedger& ledger,
                               const Clock& clock,
                               PriceFeedPtr feed,
                               OptionTerms terms,
                               const Identity& deployer)
    : clock_(clock)
    , feed_(std::move(feed))
    , terms_(std::move(terms)) {
    std::uint64_t now = clock_.now();
    validateTerms(feed_, terms_, now);
    if (deployer.empty()) {
        throw ValidationError("Deployer is required");
    }
    if (terms_.buyer == terms_.seller) {
        throw ValidationError("Bettors must be distinct");
    }

    PriceReading reading = readFreshPrice();
    if (!strikeConsistent(terms_, reading.price)) {
        throw ValidationError(std::string("Strike price is on the wrong side of the live price for a ") +
                              optionTypeName(terms_.type));
    }

    address_ = ledger.deployContract(deployer);
    escrow_ = std::make_unique<Escrow>(ledger, clock_, address_, terms_.buyer, terms_.seller);
    events_ = EventLog(address_);

    ContractEvent event;
    event.name = "Created";
    event.subject = escrow_->address();
    event.timestamp = now;
    event.attributes["buyer"] = terms_.buyer;
    event.attributes["seller"] = terms_.seller;
    event.attributes["optionType"] = optionTypeName(terms_.type);
    event.attributes["strikePrice"] = std::to_string(terms_.strikePrice);
    event.attributes["expiration"] = std::to_string(terms_.expiration);
    event.attributes["feed"] = feed_->description();
    if (terms_.heartbeat) {
        event.attributes["heartbeat"] = std::to_string(*terms_.heartbeat);
    }
    events_.append(std::move(event));
}

PriceReading OracleMediator::readFreshPrice() const {
    PriceReading reading = feed_->latestPrice();
    requireFreshReading(reading, terms_.heartbeat, clock_.now());
    return reading;
}

Identity OracleMediator::resolve(const Identity& caller) {
    ReentrancyGuard::Scope scope(guard_, "resolve");
    std::uint64_t now = clock_.now();

    std::optional<Identity> winner;
    if (now > terms_.expiration) {
        winner = evaluateResolution(terms_, now, PriceReading{});
    } else {
        winner = evaluateResolution(terms_, now, readFreshPrice());
    }
    if (!winner) {
        throw StateError("No winner yet");
    }

    escrow_->selectWinner(address_, *winner);

    ContractEvent event;
    event.name = "Resolved";
    event.subject = *winner;
    event.timestamp = now;
    event.attributes["optionType"] = optionTypeName(terms_.type);
    event.attributes["strikePrice"] = std::to_string(terms_.strikePrice);
    event.attributes["expiration"] = std::to_string(terms_.expiration);
    event.attributes["resolvedBy"] = caller;
    events_.append(std::move(event));
    return *winner;
}

} // namespace betme
