#pragma once

#include "clock.hpp"
#include "escrow.hpp"
#include "event_log.hpp"
#include "identity.hpp"
#include "price_feed.hpp"
#include "reentrancy_guard.hpp"
#include "value_ledger.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace betme {

enum class OptionType { PUT, CALL };

const char* optionTypeName(OptionType type);
std::optional<OptionType> parseOptionType(const std::string& text);

struct OptionTerms {
    OptionType type = OptionType::PUT;
    Identity buyer;
    Identity seller;
    std::int64_t strikePrice = 0;
    std::uint64_t expiration = 0;
    // Maximum age of a price reading in seconds; unset disables the staleness check.
    std::optional<std::uint64_t> heartbeat;
};

// A reading is too old once updatedAt + heartbeat <= now.
bool readingIsStale(const PriceReading& reading, std::uint64_t heartbeat, std::uint64_t now);

// Fails closed with a ValidationError when the feed never reported or, with a heartbeat
// configured, when the reading is stale at `now`.
void requireFreshReading(const PriceReading& reading,
                         const std::optional<std::uint64_t>& heartbeat,
                         std::uint64_t now);

// True when the strike sits on the side of the live price the option type requires
// at creation: a put needs strike >= price, a call needs strike <= price.
bool strikeConsistent(const OptionTerms& terms, std::int64_t livePrice);

// Decision taken by resolve() for a reading observed at `now`. Staleness is not
// checked here. Empty means the price has not crossed the strike yet.
std::optional<Identity> evaluateResolution(const OptionTerms& terms,
                                           std::uint64_t now,
                                           const PriceReading& reading);

// Resolves an escrow from a price feed instead of a human mediator. Creates the escrow
// itself, so it is the only identity allowed to pick the winner.
class OracleMediator {
public:
    OracleMediator(ValueLedger& ledger,
                   const Clock& clock,
                   PriceFeedPtr feed,
                   OptionTerms terms,
                   const Identity& deployer);

    OracleMediator(const OracleMediator&) = delete;
    OracleMediator& operator=(const OracleMediator&) = delete;

    // Anyone may call. Throws while there is no winner yet; retry later.
    Identity resolve(const Identity& caller);

    const Identity& address() const { return address_; }
    const OptionTerms& terms() const { return terms_; }
    const PriceFeed& feed() const { return *feed_; }
    Escrow& escrow() { return *escrow_; }
    const Escrow& escrow() const { return *escrow_; }
    const EventLog& events() const { return events_; }

private:
    PriceReading readFreshPrice() const;

    const Clock& clock_;
    PriceFeedPtr feed_;
    OptionTerms terms_;
    Identity address_;
    std::unique_ptr<Escrow> escrow_;
    EventLog events_;
    ReentrancyGuard guard_;
};

} // namespace betme
