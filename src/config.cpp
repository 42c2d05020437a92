#include "config.hpp"

#include "encoding.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace betme {

namespace {

std::string readEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return "";
    }
    return trim(value);
}

} // namespace

RuntimeConfig loadRuntimeConfig() {
    RuntimeConfig cfg;

    std::string deployment = readEnv("BETME_DEPLOYMENT_ID");
    if (!deployment.empty()) {
        cfg.deploymentId = deployment;
    }
    cfg.chainId = readEnv("BETME_CHAIN_ID");

    std::string heartbeat = readEnv("BETME_FEED_HEARTBEAT");
    if (!heartbeat.empty()) {
        std::uint64_t seconds = parseUnsigned(heartbeat, "BETME_FEED_HEARTBEAT");
        if (seconds > 0) {
            cfg.feedHeartbeat = seconds;
        }
    }

    std::string balance = readEnv("BETME_START_BALANCE");
    if (!balance.empty()) {
        cfg.startBalance = parseAmount(balance);
    }
    return cfg;
}

std::string requireDeploymentId() {
    const char* deploymentEnv = std::getenv("BETME_DEPLOYMENT_ID");
    if (deploymentEnv == nullptr) {
        throw std::runtime_error("BETME_DEPLOYMENT_ID must be set to a non-empty deployment scope; refusing to sign");
    }
    std::string deploymentId = trim(deploymentEnv);
    if (deploymentId.empty()) {
        throw std::runtime_error("BETME_DEPLOYMENT_ID is empty or whitespace; refusing to sign");
    }
    if (deploymentId == "default") {
        throw std::runtime_error(
            "BETME_DEPLOYMENT_ID cannot be \"default\"; set a deployment-specific value like \"mainnet\" or \"testnet\"");
    }
    return deploymentId;
}

std::string optionalChainId() {
    return readEnv("BETME_CHAIN_ID");
}

} // namespace betme
