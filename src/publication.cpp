#include "publication.hpp"

#include "encoding.hpp"

#include <sodium.h>

#include <sstream>
#include <stdexcept>
#include <vector>

namespace betme {

namespace {

constexpr const char* kPublicationDomainTag = "betme:publication:v1";

bool ensureSodiumReady() {
    static bool ready = sodium_init() >= 0;
    return ready;
}

void appendLengthPrefixed(std::ostringstream& oss, const std::string& value) {
    oss << value.size() << ':';
    oss.write(value.data(), static_cast<std::streamsize>(value.size()));
    oss << ';';
}

std::string jsonEscape(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '"' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

Publication describe(const Identity& contract,
                     const EventLog& log,
                     const Escrow& escrow,
                     const std::string& deploymentId,
                     const std::string& chainId) {
    Publication publication;
    publication.deploymentId = deploymentId;
    publication.chainId = chainId;
    publication.contract = contract;
    publication.eventRoot = log.merkleRoot();
    publication.eventCount = log.size();
    publication.phase = escrowPhaseName(escrow.phase());
    if (escrow.winner()) {
        publication.winner = *escrow.winner();
    }
    return publication;
}

} // namespace

Publication describeEscrow(const Escrow& escrow,
                           const std::string& deploymentId,
                           const std::string& chainId) {
    return describe(escrow.address(), escrow.events(), escrow, deploymentId, chainId);
}

Publication describeMediator(const OracleMediator& mediator,
                             const std::string& deploymentId,
                             const std::string& chainId) {
    return describe(mediator.address(), mediator.events(), mediator.escrow(), deploymentId, chainId);
}

std::string encodePublication(const Publication& publication) {
    std::ostringstream oss;
    oss << kPublicationDomainTag << "|";
    appendLengthPrefixed(oss, publication.deploymentId);
    appendLengthPrefixed(oss, publication.chainId);
    appendLengthPrefixed(oss, publication.contract);
    appendLengthPrefixed(oss, publication.phase);
    appendLengthPrefixed(oss, publication.winner);
    appendLengthPrefixed(oss, std::to_string(publication.eventCount));
    appendLengthPrefixed(oss, publication.eventRoot);
    return oss.str();
}

SignedPublication signPublication(const Publication& publication, const SecretBytes& secretKey) {
    if (publication.deploymentId.empty()) {
        throw std::invalid_argument("publication needs a deployment scope");
    }
    if (publication.eventRoot.empty()) {
        throw std::invalid_argument("contract has no events to publish");
    }
    if (secretKey.size() != crypto_sign_SECRETKEYBYTES) {
        throw std::invalid_argument("secret key must be " + std::to_string(crypto_sign_SECRETKEYBYTES) + " bytes");
    }
    if (!ensureSodiumReady()) {
        throw std::runtime_error("Unable to initialize libsodium");
    }

    std::vector<unsigned char> publicKey(crypto_sign_PUBLICKEYBYTES);
    if (crypto_sign_ed25519_sk_to_pk(publicKey.data(), secretKey.data()) != 0) {
        throw std::invalid_argument("unable to derive public key from secret key");
    }

    std::string message = encodePublication(publication);
    std::vector<unsigned char> signature(crypto_sign_BYTES);
    unsigned long long sigLen = 0;
    if (crypto_sign_detached(signature.data(),
                             &sigLen,
                             reinterpret_cast<const unsigned char*>(message.data()),
                             message.size(),
                             secretKey.data()) != 0) {
        throw std::runtime_error("signing failed");
    }

    SignedPublication out;
    out.publication = publication;
    out.publicKeyHex = bytesToHex(publicKey.data(), publicKey.size());
    out.signatureHex = bytesToHex(signature.data(), static_cast<std::size_t>(sigLen));
    return out;
}

bool verifyPublication(const SignedPublication& signedPublication) {
    if (!ensureSodiumReady()) {
        throw std::runtime_error("Unable to initialize libsodium");
    }
    std::vector<unsigned char> publicKey;
    std::vector<unsigned char> signature;
    try {
        publicKey = hexToBytes(signedPublication.publicKeyHex);
        signature = hexToBytes(signedPublication.signatureHex);
    } catch (const std::invalid_argument&) {
        return false;
    }
    if (publicKey.size() != crypto_sign_PUBLICKEYBYTES || signature.size() != crypto_sign_BYTES) {
        return false;
    }
    std::string message = encodePublication(signedPublication.publication);
    return crypto_sign_verify_detached(signature.data(),
                                       reinterpret_cast<const unsigned char*>(message.data()),
                                       message.size(),
                                       publicKey.data()) == 0;
}

std::string publicationToJson(const SignedPublication& signedPublication) {
    const Publication& p = signedPublication.publication;
    std::ostringstream json;
    json << "{\n";
    json << "  \"deployment_id\": \"" << jsonEscape(p.deploymentId) << "\",\n";
    if (!p.chainId.empty()) {
        json << "  \"chain_id\": \"" << jsonEscape(p.chainId) << "\",\n";
    }
    json << "  \"contract\": \"" << jsonEscape(p.contract) << "\",\n";
    json << "  \"phase\": \"" << jsonEscape(p.phase) << "\",\n";
    json << "  \"winner\": \"" << jsonEscape(p.winner) << "\",\n";
    json << "  \"event_count\": " << p.eventCount << ",\n";
    json << "  \"event_root\": \"" << p.eventRoot << "\",\n";
    json << "  \"signature\": \"" << signedPublication.signatureHex << "\",\n";
    json << "  \"public_key\": \"" << signedPublication.publicKeyHex << "\"\n";
    json << "}\n";
    return json.str();
}

} // namespace betme
