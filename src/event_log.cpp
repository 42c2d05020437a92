#include "event_log.hpp"

#include "encoding.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace betme {

namespace {

std::string escapeField(const std::string& input) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex;
    for (unsigned char c : input) {
        if (c == '|' || c == ';' || c == '=' || c == '%') {
            oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        } else {
            oss << static_cast<char>(c);
        }
    }
    return oss.str();
}

std::string hashPair(const std::string& left, const std::string& right) {
    return sha256Hex(left + right);
}

} // namespace

std::string ContractEvent::attribute(const std::string& key) const {
    auto it = attributes.find(key);
    if (it == attributes.end()) {
        return {};
    }
    return it->second;
}

std::string encodeEvent(const ContractEvent& event) {
    std::ostringstream oss;
    oss << escapeField(event.name) << "|" << escapeField(event.subject) << "|" << event.amount
        << "|" << event.timestamp << "|";
    // std::map keeps the attribute order canonical.
    for (const auto& [key, value] : event.attributes) {
        oss << escapeField(key) << "=" << escapeField(value) << ";";
    }
    return oss.str();
}

void EventLog::append(ContractEvent event) {
    std::string encoded = encodeEvent(event);
    if (!scope_.empty()) {
        encoded = escapeField(scope_) + "|" + encoded;
    }
    leaves_.push_back(sha256Hex(encoded));
    events_.push_back(std::move(event));
}

std::vector<ContractEvent> EventLog::eventsNamed(const std::string& name) const {
    std::vector<ContractEvent> out;
    for (const auto& event : events_) {
        if (event.name == name) {
            out.push_back(event);
        }
    }
    return out;
}

std::string EventLog::getLeaf(std::size_t index) const {
    if (index >= leaves_.size()) {
        return {};
    }
    return leaves_[index];
}

std::string EventLog::merkleRoot() const {
    if (leaves_.empty()) {
        return {};
    }

    std::vector<std::string> layer = leaves_;
    while (layer.size() > 1) {
        std::vector<std::string> next;
        next.reserve((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            const std::string& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
            next.push_back(hashPair(layer[i], right));
        }
        layer = std::move(next);
    }
    return layer.front();
}

std::vector<std::string> EventLog::merkleProof(std::size_t leafIndex) const {
    std::vector<std::string> proof;
    if (leafIndex >= leaves_.size()) {
        return proof;
    }

    std::vector<std::string> layer = leaves_;
    std::size_t index = leafIndex;
    while (layer.size() > 1) {
        std::size_t siblingIndex = (index % 2 == 0) ? index + 1 : index - 1;
        if (siblingIndex >= layer.size()) {
            siblingIndex = index;
        }
        proof.push_back(layer[siblingIndex]);

        std::vector<std::string> next;
        next.reserve((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            const std::string& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
            next.push_back(hashPair(layer[i], right));
        }
        layer = std::move(next);
        index /= 2;
    }
    return proof;
}

bool EventLog::verifyProof(const std::string& leaf,
                           std::size_t leafIndex,
                           std::size_t leafCount,
                           const std::vector<std::string>& proof,
                           const std::string& root) {
    if (leafIndex >= leafCount) {
        return false;
    }
    std::string current = leaf;
    std::size_t index = leafIndex;
    std::size_t width = leafCount;
    std::size_t step = 0;
    while (width > 1) {
        if (step >= proof.size()) {
            return false;
        }
        const std::string& sibling = proof[step++];
        current = (index % 2 == 0) ? hashPair(current, sibling) : hashPair(sibling, current);
        index /= 2;
        width = (width + 1) / 2;
    }
    return step == proof.size() && current == root;
}

} // namespace betme
