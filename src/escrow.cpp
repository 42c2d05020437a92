#include "escrow.hpp"

#include "errors.hpp"

#include <string>
#include <utility>

namespace betme {

const char* escrowPhaseName(EscrowPhase phase) {
    switch (phase) {
    case EscrowPhase::OPEN:
        return "open";
    case EscrowPhase::LOCKED:
        return "locked";
    case EscrowPhase::RESOLVED:
        return "resolved";
    case EscrowPhase::SETTLED:
        return "settled";
    }
    return "unknown";
}

Escrow::Escrow(ValueLedger& ledger,
               const Clock& clock,
               const Identity& creator,
               const Identity& bettorA,
               const Identity& bettorB,
               const Amount& endowment)
    : ledger_(ledger)
    , clock_(clock)
    , authority_(creator)
    , bettorA_(bettorA)
    , bettorB_(bettorB) {
    if (creator.empty()) {
        throw ValidationError("Escrow creator must not be empty");
    }
    if (bettorA_.empty() || bettorB_.empty()) {
        throw ValidationError("Both bettors are required");
    }
    if (bettorA_ == bettorB_) {
        throw ValidationError("Bettors must be distinct");
    }
    if (endowment > 0 && ledger_.balanceOf(creator) < endowment) {
        throw ValidationError("Creator cannot cover the endowment");
    }

    address_ = ledger_.deployContract(creator);
    events_ = EventLog(address_);
    if (endowment > 0) {
        ledger_.attachValue(creator, address_, endowment);
    }
}

bool Escrow::isLocked() const {
    return phase_ != EscrowPhase::OPEN;
}

Amount Escrow::stakeOf(const Identity& bettor) const {
    if (!bettor.empty() && bettor == bettorA_) {
        return stakeA_;
    }
    if (!bettor.empty() && bettor == bettorB_) {
        return stakeB_;
    }
    return Amount(0);
}

Amount Escrow::totalStaked() const {
    return stakeA_ + stakeB_;
}

Amount Escrow::heldBalance() const {
    return ledger_.balanceOf(address_);
}

bool Escrow::isBettor(const Identity& identity) const {
    return !identity.empty() && (identity == bettorA_ || identity == bettorB_);
}

void Escrow::requirePhase(EscrowPhase expected, const std::string& operation) const {
    if (phase_ == expected) {
        return;
    }
    switch (phase_) {
    case EscrowPhase::OPEN:
        throw StateError(operation + ": bet is not locked");
    case EscrowPhase::LOCKED:
        if (expected == EscrowPhase::OPEN) {
            throw StateError(operation + ": bet is already locked");
        }
        throw StateError(operation + ": winner has not been picked");
    case EscrowPhase::RESOLVED:
        if (expected == EscrowPhase::LOCKED) {
            throw StateError(operation + ": winner already picked");
        }
        throw StateError(operation + ": bet is already resolved");
    case EscrowPhase::SETTLED:
        if (expected == EscrowPhase::LOCKED) {
            throw StateError(operation + ": winner already picked");
        }
        throw StateError(operation + ": bet is already settled");
    }
    throw StateError(operation + ": unknown escrow phase");
}

void Escrow::advance(EscrowPhase next) {
    bool allowed = (phase_ == EscrowPhase::OPEN && next == EscrowPhase::LOCKED) ||
                   (phase_ == EscrowPhase::LOCKED && next == EscrowPhase::RESOLVED) ||
                   (phase_ == EscrowPhase::RESOLVED && next == EscrowPhase::SETTLED);
    if (!allowed) {
        throw InvariantError(std::string("Illegal escrow transition from ") +
                             escrowPhaseName(phase_) + " to " + escrowPhaseName(next));
    }
    phase_ = next;
}

void Escrow::deposit(const Identity& caller, const Amount& amount) {
    ReentrancyGuard::Scope scope(guard_, "deposit");
    if (amount == 0) {
        throw ValidationError("Deposit amount must be positive");
    }
    requireMember(caller, bettorA_, bettorB_, "Only bettors can deposit");
    requirePhase(EscrowPhase::OPEN, "deposit");

    std::uint64_t timestamp = clock_.now();
    Amount updated = stakeOf(caller) + amount;
    ledger_.attachValue(caller, address_, amount);
    if (caller == bettorA_) {
        stakeA_ = updated;
    } else {
        stakeB_ = updated;
    }
    if (stakeA_ > 0 && stakeA_ == stakeB_) {
        advance(EscrowPhase::LOCKED);
    }

    ContractEvent event;
    event.name = "Deposited";
    event.subject = caller;
    event.amount = amount;
    event.timestamp = timestamp;
    events_.append(std::move(event));
}

void Escrow::selectWinner(const Identity& caller, const Identity& candidate) {
    ReentrancyGuard::Scope scope(guard_, "selectWinner");
    requireCaller(caller, authority_, "Only the mediator can pick the winner");
    requirePhase(EscrowPhase::LOCKED, "selectWinner");
    if (!isBettor(candidate)) {
        throw ValidationError("Winner must be one of the bettors");
    }

    std::uint64_t timestamp = clock_.now();
    winner_ = candidate;
    advance(EscrowPhase::RESOLVED);

    ContractEvent event;
    event.name = "WinnerSelected";
    event.subject = candidate;
    event.amount = stakeOf(candidate);
    event.timestamp = timestamp;
    events_.append(std::move(event));
}

Amount Escrow::withdraw(const Identity& caller) {
    ReentrancyGuard::Scope scope(guard_, "withdraw");
    if (!winner_) {
        throw StateError("withdraw: winner has not been picked");
    }
    requireCaller(caller, *winner_, "Only the winner can withdraw");

    Amount total = totalStaked();
    if (total == 0) {
        throw InvariantError("Nothing to withdraw");
    }
    if (heldBalance() < total) {
        throw InvariantError("Escrow balance is below the staked total");
    }

    std::uint64_t timestamp = clock_.now();
    ledger_.release(address_, caller, total);
    stakeA_ = 0;
    stakeB_ = 0;
    advance(EscrowPhase::SETTLED);

    ContractEvent event;
    event.name = "Withdrawn";
    event.subject = caller;
    event.amount = total;
    event.timestamp = timestamp;
    events_.append(std::move(event));
    return total;
}

} // namespace betme
