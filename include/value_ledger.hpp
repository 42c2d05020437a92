#pragma once

#include "amount.hpp"
#include "identity.hpp"

#include <cstdint>
#include <map>
#include <set>

namespace betme {

// Native balance accounting shared by every account and contract of one deployment.
// A mutation either applies completely or throws before touching any balance.
class ValueLedger {
public:
    void mint(const Identity& account, const Amount& amount);
    Amount balanceOf(const Identity& account) const;

    // Plain value send between accounts. Contract accounts refuse it; value only
    // reaches a contract through one of its payable operations.
    void transfer(const Identity& from, const Identity& to, const Amount& amount);

    Identity deployContract(const Identity& creator);
    bool isContract(const Identity& account) const;
    std::uint64_t nonceOf(const Identity& account) const;

    // Value attached to a payable contract operation.
    void attachValue(const Identity& from, const Identity& contract, const Amount& amount);
    // Value sent out of a contract's own balance.
    void release(const Identity& contract, const Identity& to, const Amount& amount);

    static Identity deriveContractAddress(const Identity& creator, std::uint64_t nonce);

private:
    void move(const Identity& from, const Identity& to, const Amount& amount);

    std::map<Identity, Amount> balances_;
    std::map<Identity, std::uint64_t> nonces_;
    std::set<Identity> contracts_;
};

} // namespace betme
