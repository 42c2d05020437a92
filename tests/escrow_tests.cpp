#include "clock.hpp"
#include "errors.hpp"
#include "escrow.hpp"
#include "value_ledger.hpp"

#include <cstdlib>
#include <functional>
#include <iostream>
#include <string>

using namespace betme;

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "escrow_tests failure: " << msg << std::endl;
    std::exit(1);
}

void expectRejected(ErrorKind kind, const std::function<void()>& call, const std::string& what) {
    try {
        call();
    } catch (const ContractError& ex) {
        if (ex.kind() != kind) {
            fail(what + ": expected " + errorKindName(kind) + " error, got " + errorKindName(ex.kind()) +
                 " (" + ex.what() + ")");
        }
        return;
    }
    fail(what + ": call was accepted");
}

struct Fixture {
    ValueLedger ledger;
    ManualClock clock{ 1'700'000'000 };

    Fixture() {
        ledger.mint("mediator", Amount(10));
        ledger.mint("alice", Amount(10));
        ledger.mint("bob", Amount(10));
        ledger.mint("mallory", Amount(10));
    }
};

void testConstruction() {
    Fixture f;
    Escrow escrow(f.ledger, f.clock, "mediator", "alice", "bob");
    if (escrow.authority() != "mediator" || escrow.bettorA() != "alice" || escrow.bettorB() != "bob") {
        fail("roles not recorded");
    }
    if (escrow.phase() != EscrowPhase::OPEN || escrow.isLocked() || escrow.winner()) {
        fail("fresh escrow not open");
    }
    if (!f.ledger.isContract(escrow.address())) {
        fail("escrow address not registered as a contract");
    }

    expectRejected(ErrorKind::VALIDATION,
                   [&] { Escrow dup(f.ledger, f.clock, "mediator", "alice", "alice"); },
                   "duplicate bettors");
    expectRejected(ErrorKind::VALIDATION,
                   [&] { Escrow missing(f.ledger, f.clock, "mediator", "", "bob"); },
                   "missing bettor");
    expectRejected(ErrorKind::VALIDATION,
                   [&] { Escrow rich(f.ledger, f.clock, "mediator", "alice", "bob", Amount(11)); },
                   "uncovered endowment");
}

void testHappyPathWithEndowment() {
    Fixture f;
    Escrow escrow(f.ledger, f.clock, "mediator", "alice", "bob", Amount(1));
    Amount baseline = escrow.heldBalance();
    if (baseline != 1 || f.ledger.balanceOf("mediator") != 9) {
        fail("endowment not moved into escrow");
    }

    escrow.deposit("alice", Amount(1));
    if (escrow.isLocked()) {
        fail("locked after a single deposit");
    }
    escrow.deposit("bob", Amount(1));
    if (!escrow.isLocked() || escrow.phase() != EscrowPhase::LOCKED) {
        fail("equal stakes did not lock the bet");
    }

    escrow.selectWinner("mediator", "alice");
    if (!escrow.winner() || *escrow.winner() != "alice") {
        fail("winner not recorded");
    }

    Amount paid = escrow.withdraw("alice");
    if (paid != 2) {
        fail("winner should receive the whole pool");
    }
    if (f.ledger.balanceOf("alice") != 11 || f.ledger.balanceOf("bob") != 9) {
        fail("payout not reflected in balances");
    }
    if (escrow.stakeOf("alice") != 0 || escrow.stakeOf("bob") != 0) {
        fail("stakes not reset after withdrawal");
    }
    if (escrow.heldBalance() != baseline) {
        fail("escrow balance differs from its pre-deposit baseline");
    }
    if (escrow.phase() != EscrowPhase::SETTLED) {
        fail("escrow not settled");
    }

    expectRejected(ErrorKind::INVARIANT, [&] { escrow.withdraw("alice"); }, "second withdrawal");
    if (f.ledger.balanceOf("alice") != 11) {
        fail("second withdrawal moved funds");
    }

    auto names = escrow.events().events();
    if (names.size() != 4 || names[0].name != "Deposited" || names[2].name != "WinnerSelected" ||
        names[3].name != "Withdrawn") {
        fail("unexpected event sequence");
    }
    if (names[2].amount != 1 || names[3].amount != 2 || names[3].subject != "alice") {
        fail("event payloads wrong");
    }
    if (names[0].timestamp != f.clock.now()) {
        fail("event timestamp not taken from the clock");
    }
}

void testUnbalancedStakesStayOpen() {
    Fixture f;
    Escrow escrow(f.ledger, f.clock, "mediator", "alice", "bob");
    escrow.deposit("alice", Amount(1));
    escrow.deposit("bob", Amount(2));
    if (escrow.isLocked()) {
        fail("unequal stakes locked the bet");
    }
    expectRejected(ErrorKind::STATE, [&] { escrow.selectWinner("mediator", "alice"); }, "pick while open");

    // Partial deposits may catch up later; only the running totals matter.
    escrow.deposit("alice", Amount(1));
    if (!escrow.isLocked()) {
        fail("matching totals after a top-up did not lock");
    }
    if (escrow.stakeOf("alice") != 2 || escrow.stakeOf("bob") != 2 || escrow.totalStaked() != 4) {
        fail("stake totals wrong");
    }
}

void testDepositGuards() {
    Fixture f;
    Escrow escrow(f.ledger, f.clock, "mediator", "alice", "bob");
    expectRejected(ErrorKind::VALIDATION, [&] { escrow.deposit("alice", Amount(0)); }, "zero deposit");
    expectRejected(ErrorKind::AUTHORIZATION, [&] { escrow.deposit("mallory", Amount(1)); }, "outsider deposit");
    expectRejected(ErrorKind::AUTHORIZATION, [&] { escrow.deposit("mediator", Amount(1)); }, "mediator deposit");
    expectRejected(ErrorKind::VALIDATION, [&] { escrow.deposit("alice", Amount(11)); }, "unfunded deposit");
    if (escrow.stakeOf("alice") != 0 || f.ledger.balanceOf("alice") != 10 || escrow.heldBalance() != 0) {
        fail("rejected deposits mutated state");
    }

    escrow.deposit("alice", Amount(3));
    escrow.deposit("bob", Amount(3));
    expectRejected(ErrorKind::STATE, [&] { escrow.deposit("alice", Amount(1)); }, "deposit after lock (a)");
    expectRejected(ErrorKind::STATE, [&] { escrow.deposit("bob", Amount(1)); }, "deposit after lock (b)");
    if (escrow.stakeOf("alice") != 3 || escrow.heldBalance() != 6) {
        fail("deposit after lock changed stakes");
    }
}

void testSelectWinnerGuards() {
    Fixture f;
    Escrow escrow(f.ledger, f.clock, "mediator", "alice", "bob");
    escrow.deposit("alice", Amount(2));
    escrow.deposit("bob", Amount(2));

    expectRejected(ErrorKind::AUTHORIZATION, [&] { escrow.selectWinner("alice", "alice"); }, "bettor picks");
    expectRejected(ErrorKind::VALIDATION, [&] { escrow.selectWinner("mediator", "mallory"); }, "outsider wins");
    expectRejected(ErrorKind::STATE, [&] { escrow.withdraw("alice"); }, "withdraw before pick");

    escrow.selectWinner("mediator", "bob");
    expectRejected(ErrorKind::STATE, [&] { escrow.selectWinner("mediator", "alice"); }, "second pick");
    if (*escrow.winner() != "bob") {
        fail("winner changed after a second pick");
    }
    expectRejected(ErrorKind::AUTHORIZATION, [&] { escrow.withdraw("alice"); }, "loser withdraws");
    expectRejected(ErrorKind::AUTHORIZATION, [&] { escrow.withdraw("mediator"); }, "mediator withdraws");
    if (escrow.withdraw("bob") != 4) {
        fail("winner payout wrong");
    }
}

void testUnsolicitedTransfersRejected() {
    Fixture f;
    Escrow escrow(f.ledger, f.clock, "mediator", "alice", "bob");
    expectRejected(ErrorKind::VALIDATION,
                   [&] { f.ledger.transfer("alice", escrow.address(), Amount(1)); },
                   "plain transfer into escrow");
    if (escrow.heldBalance() != 0 || f.ledger.balanceOf("alice") != 10) {
        fail("unsolicited transfer moved funds");
    }
    expectRejected(ErrorKind::AUTHORIZATION,
                   [&] { f.ledger.transfer(escrow.address(), "alice", Amount(0)); },
                   "plain transfer out of escrow");
}

} // namespace

int main() {
    testConstruction();
    testHappyPathWithEndowment();
    testUnbalancedStakesStayOpen();
    testDepositGuards();
    testSelectWinnerGuards();
    testUnsolicitedTransfersRejected();

    std::cout << "escrow_tests passed" << std::endl;
    return 0;
}
