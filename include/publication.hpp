#pragma once

#include "escrow.hpp"
#include "identity.hpp"
#include "oracle_mediator.hpp"
#include "secure_memory.hpp"

#include <cstddef>
#include <string>

namespace betme {

// Snapshot of a contract's audit state, scoped to one deployment.
struct Publication {
    std::string deploymentId;
    std::string chainId;
    Identity contract;
    std::string eventRoot;
    std::size_t eventCount = 0;
    std::string phase;
    Identity winner; // empty until a winner is picked
};

struct SignedPublication {
    Publication publication;
    std::string publicKeyHex;
    std::string signatureHex;
};

Publication describeEscrow(const Escrow& escrow,
                           const std::string& deploymentId,
                           const std::string& chainId = {});
// The mediator publishes its own event log together with the state of the escrow it owns.
Publication describeMediator(const OracleMediator& mediator,
                             const std::string& deploymentId,
                             const std::string& chainId = {});

// Canonical signed message; every field is length-prefixed.
std::string encodePublication(const Publication& publication);

// Ed25519 over encodePublication(). Throws std::invalid_argument on an empty deployment
// scope, an empty event log or a malformed key.
SignedPublication signPublication(const Publication& publication, const SecretBytes& secretKey);
bool verifyPublication(const SignedPublication& signedPublication);

std::string publicationToJson(const SignedPublication& signedPublication);

} // namespace betme
