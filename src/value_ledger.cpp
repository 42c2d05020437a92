#include "value_ledger.hpp"

#include "errors.hpp"
#include "encoding.hpp"

#include <sstream>

namespace betme {

namespace {

constexpr const char* kAddressDomainTag = "betme:contract-address:v1";
constexpr std::size_t kAddressHexChars = 40;

} // namespace

Identity ValueLedger::deriveContractAddress(const Identity& creator, std::uint64_t nonce) {
    std::ostringstream oss;
    oss << kAddressDomainTag << "|" << creator.size() << ":" << creator << "|" << nonce;
    return "0x" + sha256Hex(oss.str()).substr(0, kAddressHexChars);
}

void ValueLedger::mint(const Identity& account, const Amount& amount) {
    if (account.empty()) {
        throw ValidationError("Cannot mint to an empty identity");
    }
    Amount updated = balanceOf(account) + amount;
    balances_[account] = updated;
}

Amount ValueLedger::balanceOf(const Identity& account) const {
    auto it = balances_.find(account);
    if (it == balances_.end()) {
        return Amount(0);
    }
    return it->second;
}

void ValueLedger::transfer(const Identity& from, const Identity& to, const Amount& amount) {
    if (isContract(to)) {
        throw ValidationError("Contract " + to + " does not accept plain value transfers");
    }
    if (isContract(from)) {
        throw AuthorizationError("Contract funds can only leave through the contract itself");
    }
    move(from, to, amount);
}

Identity ValueLedger::deployContract(const Identity& creator) {
    if (creator.empty()) {
        throw ValidationError("Contract creator must not be empty");
    }
    std::uint64_t nonce = nonces_[creator];
    Identity address = deriveContractAddress(creator, nonce);
    if (contracts_.count(address) != 0 || balances_.count(address) != 0) {
        throw InvariantError("Contract address collision at " + address);
    }
    contracts_.insert(address);
    nonces_[creator] = nonce + 1;
    return address;
}

bool ValueLedger::isContract(const Identity& account) const {
    return contracts_.count(account) != 0;
}

std::uint64_t ValueLedger::nonceOf(const Identity& account) const {
    auto it = nonces_.find(account);
    return it == nonces_.end() ? 0 : it->second;
}

void ValueLedger::attachValue(const Identity& from, const Identity& contract, const Amount& amount) {
    if (!isContract(contract)) {
        throw ValidationError(contract + " is not a contract");
    }
    move(from, contract, amount);
}

void ValueLedger::release(const Identity& contract, const Identity& to, const Amount& amount) {
    if (!isContract(contract)) {
        throw ValidationError(contract + " is not a contract");
    }
    if (isContract(to)) {
        throw ValidationError("Contract " + to + " does not accept plain value transfers");
    }
    move(contract, to, amount);
}

void ValueLedger::move(const Identity& from, const Identity& to, const Amount& amount) {
    if (from.empty() || to.empty()) {
        throw ValidationError("Transfer endpoints must not be empty");
    }
    Amount available = balanceOf(from);
    if (available < amount) {
        throw ValidationError("Insufficient balance in " + from);
    }
    if (amount == 0 || from == to) {
        return;
    }
    // Compute both sides first so an overflow leaves the ledger untouched.
    Amount debited = available - amount;
    Amount credited = balanceOf(to) + amount;
    balances_[from] = debited;
    balances_[to] = credited;
}

} // namespace betme
