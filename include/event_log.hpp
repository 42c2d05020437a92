#pragma once

#include "amount.hpp"
#include "identity.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace betme {

struct ContractEvent {
    std::string name;
    Identity subject;
    Amount amount;
    std::uint64_t timestamp = 0;
    // Extra event-specific fields, e.g. strike or option type.
    std::map<std::string, std::string> attributes;

    std::string attribute(const std::string& key) const;
};

// Canonical single-line form: name|subject|amount|timestamp|k=v;k=v;
// Field values are percent-escaped so the separators stay unambiguous.
std::string encodeEvent(const ContractEvent& event);

class EventLog {
public:
    explicit EventLog(std::string scope = {}) : scope_(std::move(scope)) {}

    void append(ContractEvent event);

    const std::vector<ContractEvent>& events() const { return events_; }
    std::vector<ContractEvent> eventsNamed(const std::string& name) const;
    std::size_t size() const { return events_.size(); }
    bool empty() const { return events_.empty(); }
    const std::string& scope() const { return scope_; }

    std::string getLeaf(std::size_t index) const;
    std::string merkleRoot() const;
    std::vector<std::string> merkleProof(std::size_t leafIndex) const;
    static bool verifyProof(const std::string& leaf,
                            std::size_t leafIndex,
                            std::size_t leafCount,
                            const std::vector<std::string>& proof,
                            const std::string& root);

private:
    std::string scope_;
    std::vector<ContractEvent> events_;
    std::vector<std::string> leaves_;
};

} // namespace betme
