#include "draw_context.hpp"
#include "eligibility.hpp"
#include "errors.hpp"
#include "raffle_fixture.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "upkeep_test failure: " << msg << std::endl;
    std::exit(1);
}

using namespace rf;
using namespace std::chrono_literals;
using rf::test::RaffleHarness;

const Timestamp kStart = Timestamp(std::chrono::seconds(1'700'000'000));
const std::chrono::seconds kInterval = 30s;

// A context where every conjunct holds at kStart + 31s.
std::unique_ptr<DrawContext> eligibleContext() {
    auto ctx = std::make_unique<DrawContext>(kStart);
    ctx->players.append(Entrant{ "alice", Amount::fromMicros(10'000) });
    ctx->treasury.deposit(Amount::fromMicros(10'000));
    return ctx;
}

void eachConjunctIsRequired() {
    const Timestamp later = kStart + 31s;

    if (!evaluateUpkeep(*eligibleContext(), kInterval, later).upkeepNeeded) {
        fail("fully eligible context reported no upkeep");
    }

    if (evaluateUpkeep(*eligibleContext(), kInterval, kStart + 29s).upkeepNeeded) {
        fail("upkeep reported before the interval elapsed");
    }
    if (!evaluateUpkeep(*eligibleContext(), kInterval, kStart + 30s).upkeepNeeded) {
        fail("interval boundary should be inclusive");
    }
    if (evaluateUpkeep(*eligibleContext(), kInterval, kStart - 5s).upkeepNeeded) {
        fail("clock before the last draw counted as elapsed");
    }

    auto calculating = eligibleContext();
    calculating->round.beginCalculating();
    calculating->round.bindRequest(1);
    if (evaluateUpkeep(*calculating, kInterval, later).upkeepNeeded) {
        fail("upkeep reported while CALCULATING");
    }

    auto noBalance = std::make_unique<DrawContext>(kStart);
    noBalance->players.append(Entrant{ "alice", Amount() });
    if (evaluateUpkeep(*noBalance, kInterval, later).upkeepNeeded) {
        fail("upkeep reported with an empty treasury");
    }

    auto noPlayers = std::make_unique<DrawContext>(kStart);
    noPlayers->treasury.deposit(Amount::fromMicros(10'000));
    if (evaluateUpkeep(*noPlayers, kInterval, later).upkeepNeeded) {
        fail("upkeep reported with no entrants");
    }
}

void statusCarriesDiagnostics() {
    auto ctx = eligibleContext();
    auto status = evaluateUpkeep(*ctx, kInterval, kStart);
    if (status.upkeepNeeded || status.numPlayers != 1 ||
        status.balance != Amount::fromMicros(10'000) || status.phase != RoundPhase::OPEN) {
        fail("upkeep status diagnostics are wrong");
    }
}

void requestWithoutPlayersIsRejected() {
    RaffleHarness h;
    h.advance(31s);
    if (h.raffle->checkUpkeep(h.now)) {
        fail("empty raffle reported upkeep");
    }

    bool caught = false;
    try {
        h.raffle->requestDraw(h.now);
    } catch (const UpkeepNotNeeded& ex) {
        caught = ex.balance().isZero() && ex.numPlayers() == 0 && ex.phase() == RoundPhase::OPEN;
    }
    if (!caught) {
        fail("requestDraw on an empty raffle did not report (0, 0, OPEN)");
    }
    if (h.raffle->getRaffleState() != RoundPhase::OPEN || h.raffle->getPendingRequest()) {
        fail("rejected requestDraw changed the round");
    }
    if (h.oracle->pendingCount() != 0) {
        fail("rejected requestDraw reached the oracle");
    }
}

void zeroFeeRaffleNeedsBalance() {
    RaffleConfig cfg;
    cfg.entranceFee = Amount();
    RaffleHarness h(cfg);
    h.raffle->enter("freeloader", Amount());
    h.advance(31s);
    if (h.raffle->checkUpkeep(h.now)) {
        fail("upkeep reported with players but no balance");
    }
}

void checkUpkeepHasNoSideEffects() {
    RaffleHarness h;
    h.enterPlayers(1);
    h.advance(31s);
    for (int i = 0; i < 3; ++i) {
        if (!h.raffle->checkUpkeep(h.now)) {
            fail("eligible raffle reported no upkeep");
        }
    }
    if (h.raffle->getRaffleState() != RoundPhase::OPEN || h.oracle->pendingCount() != 0) {
        fail("checkUpkeep mutated the round");
    }
}

} // namespace

int main() {
    eachConjunctIsRequired();
    statusCarriesDiagnostics();
    requestWithoutPlayersIsRejected();
    zeroFeeRaffleNeedsBalance();
    checkUpkeepHasNoSideEffects();

    std::cout << "upkeep_test passed" << std::endl;
    return 0;
}
