#include "clock.hpp"
#include "escrow.hpp"
#include "oracle_mediator.hpp"
#include "price_feed.hpp"
#include "publication.hpp"
#include "secure_memory.hpp"
#include "value_ledger.hpp"

#include <sodium.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

using namespace betme;

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "publication_tests failure: " << msg << std::endl;
    std::exit(1);
}

SecretBytes freshSigningKey() {
    unsigned char publicKey[crypto_sign_PUBLICKEYBYTES];
    SecretBytes secretKey(crypto_sign_SECRETKEYBYTES);
    if (crypto_sign_keypair(publicKey, secretKey.data()) != 0) {
        fail("key generation failed");
    }
    return secretKey;
}

void testSettledEscrow() {
    ValueLedger ledger;
    ManualClock clock(1'700'000'000);
    ledger.mint("alice", Amount(5));
    ledger.mint("bob", Amount(5));
    Escrow escrow(ledger, clock, "mediator", "alice", "bob");

    Publication open = describeEscrow(escrow, "testnet");
    if (!open.eventRoot.empty() || open.eventCount != 0 || open.phase != "open" || !open.winner.empty()) {
        fail("fresh escrow described wrongly");
    }
    SecretBytes key = freshSigningKey();
    bool emptyRefused = false;
    try {
        (void)signPublication(open, key);
    } catch (const std::invalid_argument&) {
        emptyRefused = true;
    }
    if (!emptyRefused) {
        fail("signed a contract without events");
    }

    escrow.deposit("alice", Amount(2));
    escrow.deposit("bob", Amount(2));
    escrow.selectWinner("mediator", "bob");
    escrow.withdraw("bob");

    Publication settled = describeEscrow(escrow, "testnet", "chain-7");
    if (settled.contract != escrow.address() || settled.eventRoot != escrow.events().merkleRoot() ||
        settled.eventCount != 4 || settled.phase != "settled" || settled.winner != "bob") {
        fail("settled escrow described wrongly");
    }

    std::string expected = "betme:publication:v1|7:testnet;7:chain-7;" + std::to_string(escrow.address().size()) +
                           ":" + escrow.address() + ";7:settled;3:bob;1:4;64:" + settled.eventRoot + ";";
    if (encodePublication(settled) != expected) {
        fail("canonical publication message changed: " + encodePublication(settled));
    }

    SignedPublication signedPublication = signPublication(settled, key);
    if (!verifyPublication(signedPublication)) {
        fail("signature does not verify");
    }

    SignedPublication forged = signedPublication;
    forged.publication.winner = "alice";
    if (verifyPublication(forged)) {
        fail("changed winner still verifies");
    }
    forged = signedPublication;
    forged.publication.deploymentId = "mainnet";
    if (verifyPublication(forged)) {
        fail("signature not bound to the deployment scope");
    }
    forged = signedPublication;
    forged.signatureHex = "zz";
    if (verifyPublication(forged)) {
        fail("malformed signature verified");
    }

    std::string json = publicationToJson(signedPublication);
    if (json.find("\"winner\": \"bob\"") == std::string::npos ||
        json.find("\"event_root\": \"" + settled.eventRoot + "\"") == std::string::npos ||
        json.find("\"chain_id\": \"chain-7\"") == std::string::npos) {
        fail("receipt missing fields: " + json);
    }

    Publication unscoped = settled;
    unscoped.deploymentId.clear();
    bool unscopedRefused = false;
    try {
        (void)signPublication(unscoped, key);
    } catch (const std::invalid_argument&) {
        unscopedRefused = true;
    }
    if (!unscopedRefused) {
        fail("signed without a deployment scope");
    }
}

void testResolvedMediator() {
    ValueLedger ledger;
    ManualClock clock(1'700'000'000);
    ledger.mint("alice", Amount(5));
    ledger.mint("bob", Amount(5));
    auto feed = std::make_shared<ManualPriceFeed>();
    feed->publish(90, clock.now());

    OptionTerms terms;
    terms.type = OptionType::PUT;
    terms.buyer = "alice";
    terms.seller = "bob";
    terms.strikePrice = 100;
    terms.expiration = clock.now() + 600;
    OracleMediator mediator(ledger, clock, feed, terms, "deployer");
    mediator.escrow().deposit("alice", Amount(1));
    mediator.escrow().deposit("bob", Amount(1));
    mediator.resolve("alice");

    Publication publication = describeMediator(mediator, "testnet");
    if (publication.contract != mediator.address() || publication.eventRoot != mediator.events().merkleRoot() ||
        publication.eventCount != 2 || publication.phase != "resolved" || publication.winner != "alice") {
        fail("mediator described wrongly");
    }
    if (!verifyPublication(signPublication(publication, freshSigningKey()))) {
        fail("mediator publication does not verify");
    }
}

} // namespace

int main() {
    if (sodium_init() < 0) {
        fail("libsodium unavailable");
    }

    testSettledEscrow();
    testResolvedMediator();

    std::cout << "publication_tests passed" << std::endl;
    return 0;
}
