#pragma once

#include "amount.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace betme {

struct RuntimeConfig {
    std::string deploymentId = "local-cli";
    std::string chainId;
    std::optional<std::uint64_t> feedHeartbeat;
    Amount startBalance = Amount(100);
};

// Reads BETME_DEPLOYMENT_ID, BETME_CHAIN_ID, BETME_FEED_HEARTBEAT and BETME_START_BALANCE
// on top of the defaults above.
RuntimeConfig loadRuntimeConfig();

// Deployment scope for anything that gets signed. Unlike loadRuntimeConfig() this refuses
// a missing, blank or "default" BETME_DEPLOYMENT_ID.
std::string requireDeploymentId();
std::string optionalChainId();

} // namespace betme
