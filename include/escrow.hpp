#pragma once

#include "amount.hpp"
#include "clock.hpp"
#include "event_log.hpp"
#include "identity.hpp"
#include "reentrancy_guard.hpp"
#include "value_ledger.hpp"

#include <optional>
#include <string>

namespace betme {

enum class EscrowPhase {
    OPEN,     // accepting deposits, stakes not yet balanced
    LOCKED,   // stakes balanced, waiting for the authority
    RESOLVED, // winner chosen, pool not yet withdrawn
    SETTLED   // pool paid out
};

const char* escrowPhaseName(EscrowPhase phase);

// Two-party wager. The creator becomes the authority that picks the winner.
class Escrow {
public:
    Escrow(ValueLedger& ledger,
           const Clock& clock,
           const Identity& creator,
           const Identity& bettorA,
           const Identity& bettorB,
           const Amount& endowment = Amount(0));

    Escrow(const Escrow&) = delete;
    Escrow& operator=(const Escrow&) = delete;

    void deposit(const Identity& caller, const Amount& amount);
    void selectWinner(const Identity& caller, const Identity& candidate);
    Amount withdraw(const Identity& caller);

    const Identity& address() const { return address_; }
    const Identity& authority() const { return authority_; }
    const Identity& bettorA() const { return bettorA_; }
    const Identity& bettorB() const { return bettorB_; }
    EscrowPhase phase() const { return phase_; }
    bool isLocked() const;
    const std::optional<Identity>& winner() const { return winner_; }
    Amount stakeOf(const Identity& bettor) const;
    Amount totalStaked() const;
    Amount heldBalance() const;
    const EventLog& events() const { return events_; }

private:
    // All lifecycle checks go through here.
    void requirePhase(EscrowPhase expected, const std::string& operation) const;
    void advance(EscrowPhase next);
    bool isBettor(const Identity& identity) const;

    ValueLedger& ledger_;
    const Clock& clock_;
    Identity address_;
    Identity authority_;
    Identity bettorA_;
    Identity bettorB_;
    Amount stakeA_;
    Amount stakeB_;
    EscrowPhase phase_ = EscrowPhase::OPEN;
    std::optional<Identity> winner_;
    EventLog events_;
    ReentrancyGuard guard_;
};

} // namespace betme
