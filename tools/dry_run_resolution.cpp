#include "encoding.hpp"
#include "errors.hpp"
#include "oracle_mediator.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 7) {
        std::cerr << "Usage: dry_run_resolution <put|call> <strike> <expiration> <now> <price> <updatedAt> "
                     "[heartbeat]\n";
        return 1;
    }

    auto type = betme::parseOptionType(argv[1]);
    if (!type) {
        std::cerr << "Option type must be put or call\n";
        return 1;
    }

    betme::OptionTerms terms;
    terms.type = *type;
    terms.buyer = "buyer";
    terms.seller = "seller";
    std::uint64_t now = 0;
    betme::PriceReading reading;
    try {
        terms.strikePrice = betme::parseSigned(argv[2], "strike");
        terms.expiration = betme::parseUnsigned(argv[3], "expiration");
        now = betme::parseUnsigned(argv[4], "now");
        reading.price = betme::parseSigned(argv[5], "price");
        reading.updatedAt = betme::parseUnsigned(argv[6], "updatedAt");
        if (argc > 7) {
            terms.heartbeat = betme::parseUnsigned(argv[7], "heartbeat");
        }
    } catch (const std::invalid_argument& ex) {
        std::cerr << ex.what() << '\n';
        return 1;
    }

    std::cout << "Option: " << betme::optionTypeName(terms.type) << " strike " << terms.strikePrice
              << " expiring at " << terms.expiration << '\n';
    std::cout << "Reading: " << reading.price << " at " << reading.updatedAt << ", now " << now << '\n';

    // Past expiration the mediator never reads the feed.
    if (now <= terms.expiration) {
        try {
            betme::requireFreshReading(reading, terms.heartbeat, now);
        } catch (const betme::ValidationError& ex) {
            std::cout << "Decision: refused, " << ex.what() << '\n';
            return 2;
        }
    }

    auto winner = betme::evaluateResolution(terms, now, reading);
    if (!winner) {
        std::cout << "Decision: no winner yet, retry later\n";
        return 3;
    }
    std::cout << "Decision: " << *winner << " wins";
    if (now > terms.expiration) {
        std::cout << " (expired)";
    }
    std::cout << '\n';
    return 0;
}
