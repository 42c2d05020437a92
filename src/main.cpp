#include "clock.hpp"
#include "config.hpp"
#include "encoding.hpp"
#include "errors.hpp"
#include "escrow.hpp"
#include "oracle_mediator.hpp"
#include "price_feed.hpp"
#include "publication.hpp"
#include "secure_memory.hpp"
#include "value_ledger.hpp"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace betme;

namespace {

const std::vector<Identity> kParticipants{ "mediator", "alice", "bob", "carol" };

void printUsage() {
    std::cerr << "Usage: betme manual\n"
              << "       betme <put|call> <strike> <livePrice> <expiresInSeconds> [heartbeatSeconds]\n"
              << "Environment: BETME_START_BALANCE funds each demo account, BETME_FEED_HEARTBEAT sets a "
                 "default heartbeat, BETME_DEPLOYMENT_ID/BETME_CHAIN_ID label the session.\n";
}

void printHelp() {
    std::cout << "Commands:\n"
              << "  deposit <who> <amount>     stake native value\n"
              << "  pick <who> <candidate>     mediator picks the winner (manual mode)\n"
              << "  price <value>              publish a price reading now (oracle mode)\n"
              << "  advance <seconds>          move the clock forward\n"
              << "  resolve <who>              ask the oracle mediator to resolve (oracle mode)\n"
              << "  withdraw <who>             winner collects the pool\n"
              << "  transfer <from> <to> <amt> plain value transfer\n"
              << "  publish <secretKeyHex> [out.json]  sign the event root (needs BETME_DEPLOYMENT_ID)\n"
              << "  status | balances | events | help | quit\n";
}

void printStatus(const Escrow& escrow, const ManualClock& clock) {
    std::cout << "Escrow " << escrow.address() << " [" << escrowPhaseName(escrow.phase()) << "]\n";
    std::cout << "  time:      " << clock.now() << "\n";
    std::cout << "  authority: " << escrow.authority() << "\n";
    std::cout << "  " << escrow.bettorA() << " staked " << escrow.stakeOf(escrow.bettorA()) << "\n";
    std::cout << "  " << escrow.bettorB() << " staked " << escrow.stakeOf(escrow.bettorB()) << "\n";
    std::cout << "  locked:    " << (escrow.isLocked() ? "yes" : "no") << "\n";
    std::cout << "  winner:    " << (escrow.winner() ? *escrow.winner() : std::string("-")) << "\n";
    std::cout << "  held:      " << escrow.heldBalance() << "\n";
}

void printBalances(const ValueLedger& ledger, const Escrow& escrow) {
    for (const auto& who : kParticipants) {
        std::cout << "  " << who << ": " << ledger.balanceOf(who) << "\n";
    }
    std::cout << "  " << escrow.address() << " (escrow): " << ledger.balanceOf(escrow.address()) << "\n";
}

void printEvents(const EventLog& log, const std::string& label) {
    std::cout << label << " events (" << log.size() << "), root " << log.merkleRoot() << "\n";
    for (const auto& event : log.events()) {
        std::cout << "  " << encodeEvent(event) << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage();
        return 1;
    }

    RuntimeConfig cfg;
    try {
        cfg = loadRuntimeConfig();
    } catch (const std::exception& ex) {
        std::cerr << "Configuration error: " << ex.what() << "\n";
        return 1;
    }

    std::string mode = argv[1];
    ValueLedger ledger;
    SystemClock systemClock;
    ManualClock clock(systemClock.now());
    for (const auto& who : kParticipants) {
        ledger.mint(who, cfg.startBalance);
    }

    std::unique_ptr<Escrow> manualEscrow;
    std::unique_ptr<OracleMediator> mediator;
    std::shared_ptr<ManualPriceFeed> feed;

    try {
        if (mode == "manual") {
            manualEscrow = std::make_unique<Escrow>(ledger, clock, "mediator", "alice", "bob");
        } else if (auto type = parseOptionType(mode)) {
            if (argc < 5) {
                printUsage();
                return 1;
            }
            OptionTerms terms;
            terms.type = *type;
            terms.buyer = "alice";
            terms.seller = "bob";
            terms.strikePrice = parseSigned(argv[2], "strike");
            terms.expiration = clock.now() + parseUnsigned(argv[4], "expiresInSeconds");
            terms.heartbeat = cfg.feedHeartbeat;
            if (argc > 5) {
                terms.heartbeat = parseUnsigned(argv[5], "heartbeat");
            }
            feed = std::make_shared<ManualPriceFeed>("console");
            feed->publish(parseSigned(argv[3], "live price"), clock.now());
            mediator = std::make_unique<OracleMediator>(ledger, clock, feed, terms, "mediator");
        } else {
            printUsage();
            return 1;
        }
    } catch (const std::exception& ex) {
        std::cerr << "Deployment failed: " << ex.what() << "\n";
        return 1;
    }

    Escrow& escrow = mediator ? mediator->escrow() : *manualEscrow;

    std::cout << "BetMe session " << cfg.deploymentId;
    if (!cfg.chainId.empty()) {
        std::cout << " | " << cfg.chainId;
    }
    std::cout << "\n";
    if (mediator) {
        const auto& terms = mediator->terms();
        std::cout << "Oracle mediator " << mediator->address() << ": " << optionTypeName(terms.type)
                  << " strike " << terms.strikePrice << " expires at " << terms.expiration;
        if (terms.heartbeat) {
            std::cout << " heartbeat " << *terms.heartbeat << "s";
        }
        std::cout << "\n";
        std::cout << "Buyer " << terms.buyer << ", seller " << terms.seller << "\n";
    } else {
        std::cout << "Manual mediator: " << escrow.authority() << ", bettors alice and bob\n";
    }
    printHelp();

    std::string line;
    while (true) {
        std::cout << "> " << std::flush;
        if (!std::getline(std::cin, line)) {
            break;
        }
        std::istringstream iss(line);
        std::string command;
        if (!(iss >> command)) {
            continue;
        }

        try {
            if (command == "quit" || command == "exit") {
                break;
            } else if (command == "help") {
                printHelp();
            } else if (command == "status") {
                printStatus(escrow, clock);
            } else if (command == "balances") {
                printBalances(ledger, escrow);
            } else if (command == "events") {
                if (mediator) {
                    printEvents(mediator->events(), "Mediator");
                }
                printEvents(escrow.events(), "Escrow");
            } else if (command == "deposit") {
                std::string who;
                std::string amount;
                if (!(iss >> who >> amount)) {
                    std::cout << "usage: deposit <who> <amount>\n";
                    continue;
                }
                escrow.deposit(who, parseAmount(amount));
                std::cout << who << " staked " << escrow.stakeOf(who) << " in total"
                          << (escrow.isLocked() ? "; bet is locked" : "") << "\n";
            } else if (command == "pick") {
                std::string who;
                std::string candidate;
                if (!(iss >> who >> candidate)) {
                    std::cout << "usage: pick <who> <candidate>\n";
                    continue;
                }
                escrow.selectWinner(who, candidate);
                std::cout << "Winner: " << candidate << "\n";
            } else if (command == "price") {
                std::string value;
                if (!feed || !(iss >> value)) {
                    std::cout << "usage: price <value> (oracle mode only)\n";
                    continue;
                }
                feed->publish(parseSigned(value, "price"), clock.now());
                std::cout << "Published " << value << " at " << clock.now() << "\n";
            } else if (command == "advance") {
                std::string seconds;
                if (!(iss >> seconds)) {
                    std::cout << "usage: advance <seconds>\n";
                    continue;
                }
                clock.advance(parseUnsigned(seconds, "seconds"));
                std::cout << "Time is now " << clock.now() << "\n";
            } else if (command == "resolve") {
                std::string who;
                if (!mediator || !(iss >> who)) {
                    std::cout << "usage: resolve <who> (oracle mode only)\n";
                    continue;
                }
                Identity winner = mediator->resolve(who);
                std::cout << "Resolved. Winner: " << winner << "\n";
            } else if (command == "withdraw") {
                std::string who;
                if (!(iss >> who)) {
                    std::cout << "usage: withdraw <who>\n";
                    continue;
                }
                Amount paid = escrow.withdraw(who);
                std::cout << who << " withdrew " << paid << "\n";
            } else if (command == "publish") {
                std::string secretHex;
                std::string outputPath;
                if (!(iss >> secretHex)) {
                    std::cout << "usage: publish <secretKeyHex> [out.json]\n";
                    continue;
                }
                iss >> outputPath;
                std::string deploymentId = requireDeploymentId();
                std::string chainId = optionalChainId();
                SecretBytes secretKey(hexToBytes(secretHex));
                secureZero(&secretHex[0], secretHex.size());
                Publication publication = mediator ? describeMediator(*mediator, deploymentId, chainId)
                                                   : describeEscrow(escrow, deploymentId, chainId);
                std::string json = publicationToJson(signPublication(publication, secretKey));
                if (outputPath.empty()) {
                    std::cout << json;
                } else {
                    std::ofstream ofs(outputPath);
                    if (!ofs) {
                        throw std::runtime_error("Unable to open output path: " + outputPath);
                    }
                    ofs << json;
                    std::cout << "Wrote " << outputPath << "\n";
                }
            } else if (command == "transfer") {
                std::string from;
                std::string to;
                std::string amount;
                if (!(iss >> from >> to >> amount)) {
                    std::cout << "usage: transfer <from> <to> <amount>\n";
                    continue;
                }
                if (to == "escrow") {
                    to = escrow.address();
                }
                ledger.transfer(from, to, parseAmount(amount));
                std::cout << "Transferred " << amount << " from " << from << " to " << to << "\n";
            } else {
                std::cout << "Unknown command. Type help.\n";
            }
        } catch (const ContractError& ex) {
            std::cout << "Rejected (" << errorKindName(ex.kind()) << "): " << ex.what() << "\n";
        } catch (const std::exception& ex) {
            std::cout << "Error: " << ex.what() << "\n";
        }
    }

    std::cout << "\nFinal balances:\n";
    printBalances(ledger, escrow);
    return 0;
}
