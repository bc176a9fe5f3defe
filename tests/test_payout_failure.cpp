#include "errors.hpp"
#include "raffle_fixture.hpp"

#include <chrono>
#include <cstdlib>
#include <future>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "payout_failure_test failure: " << msg << std::endl;
    std::exit(1);
}

using namespace rf;
using namespace std::chrono_literals;
using rf::test::RaffleHarness;

class ThrowingGateway : public PayoutGateway {
public:
    bool transfer(const Identity&, Amount) override {
        throw std::runtime_error("wallet backend offline");
    }
};

// A wallet that inspects the raffle from inside its own transfer.
class InspectingGateway : public PayoutGateway {
public:
    Raffle* raffle = nullptr;
    bool failing = false;
    std::vector<RoundPhase> phasesSeen;
    std::vector<Amount> balancesSeen;

    bool transfer(const Identity&, Amount) override {
        phasesSeen.push_back(raffle->getRaffleState());
        balancesSeen.push_back(raffle->getBalance());
        return !failing;
    }
};

template <typename Fn>
auto runWithDeadline(Fn&& fn, const std::string& what) {
    auto pending = std::async(std::launch::async, std::forward<Fn>(fn));
    if (pending.wait_for(std::chrono::seconds(5)) != std::future_status::ready) {
        fail(what + " did not return; the raffle lock was held across the transfer");
    }
    return pending;
}

void gatewayMayReadTheRaffleDuringTransfer() {
    auto oracle = std::make_shared<LocalVrfOracle>(rf::test::kOracleSeedHex);
    auto gateway = std::make_shared<InspectingGateway>();
    Timestamp now = Timestamp(std::chrono::seconds(1'700'000'000));
    RaffleConfig cfg;
    Raffle raffle(cfg, oracle, gateway, now, [&now]() { return now; });
    gateway->raffle = &raffle;

    raffle.enter("alice", cfg.entranceFee);
    raffle.enter("bob", cfg.entranceFee);
    now += 31s;
    RequestToken token = raffle.requestDraw(now);
    oracle->advanceBlocks(3);

    runWithDeadline([&] { oracle->fulfillWithWords(token, { RandomWord(1) }, raffle); },
                    "paid fulfillment")
        .get();
    if (gateway->phasesSeen != std::vector<RoundPhase>{ RoundPhase::OPEN } ||
        !gateway->balancesSeen.front().isZero()) {
        fail("transfer ran before the reset was committed");
    }
    if (raffle.getRecentWinner() != Identity("bob") || !raffle.getLastDraw()->paid) {
        fail("paid draw not recorded");
    }

    raffle.enter("carol", cfg.entranceFee);
    now += 31s;
    token = raffle.requestDraw(now);
    oracle->advanceBlocks(3);
    gateway->failing = true;

    auto failedDraw = runWithDeadline(
        [&] { oracle->fulfillWithWords(token, { RandomWord(0) }, raffle); }, "unpaid fulfillment");
    bool caught = false;
    try {
        failedDraw.get();
    } catch (const PayoutFailed&) {
        caught = true;
    }
    if (!caught || raffle.getUnpaidPrize("carol") != cfg.entranceFee) {
        fail("failed transfer inside a re-entrant gateway was not held as unpaid");
    }

    gateway->failing = false;
    bool settled = runWithDeadline([&] { return raffle.retryUnpaidPrize("carol"); }, "retry").get();
    if (!settled || !raffle.getUnpaidPrize("carol").isZero() || gateway->phasesSeen.size() != 3) {
        fail("retry through a re-entrant gateway did not settle the prize");
    }
}

void throwingObserverDoesNotMaskPayoutFailure() {
    RaffleHarness h;
    RaffleEvents events;
    events.onWinnerPicked = [](const Identity&) { throw std::runtime_error("dashboard offline"); };
    h.raffle->setEvents(events);

    h.enterPlayers(2);
    RequestToken token = h.closeRound();
    h.oracle->advanceBlocks(3);
    h.ledger->setFailing(true);

    bool payoutFailed = false;
    try {
        h.oracle->fulfillWithWords(token, { RandomWord(0) }, *h.raffle);
    } catch (const PayoutFailed&) {
        payoutFailed = true;
    } catch (const std::runtime_error& ex) {
        fail(std::string("observer error escaped the fulfillment: ") + ex.what());
    }
    if (!payoutFailed || h.raffle->getUnpaidPrize("player0") != h.fee() * 2) {
        fail("payout failure was not reported past a throwing observer");
    }

    h.ledger->setFailing(false);
    h.enterPlayers(1);
    token = h.closeRound();
    h.oracle->advanceBlocks(3);
    try {
        h.oracle->fulfillWithWords(token, { RandomWord(0) }, *h.raffle);
    } catch (const std::exception& ex) {
        fail(std::string("throwing observer failed a paid draw: ") + ex.what());
    }
    if (h.ledger->balanceOf("player0") != h.fee()) {
        fail("paid draw did not reach the ledger");
    }
}

void failedTransferCommitsResetAndHoldsPrize() {
    RaffleHarness h;
    std::vector<Identity> winners;
    RaffleEvents events;
    events.onWinnerPicked = [&winners](const Identity& who) { winners.push_back(who); };
    h.raffle->setEvents(events);

    h.enterPlayers(3);
    RequestToken token = h.closeRound();
    h.ledger->setFailing(true);
    h.oracle->advanceBlocks(3);

    bool caught = false;
    try {
        h.oracle->fulfillWithWords(token, { RandomWord(2) }, *h.raffle);
    } catch (const PayoutFailed& ex) {
        caught = ex.winner() == "player2" && ex.amount() == h.fee() * 3;
    }
    if (!caught) {
        fail("failed transfer did not surface as PayoutFailed");
    }

    if (h.raffle->getRaffleState() != RoundPhase::OPEN || h.raffle->getPendingRequest() ||
        h.raffle->getNumberOfPlayers() != 0 || !h.raffle->getBalance().isZero()) {
        fail("round not reset after the failed payout");
    }
    if (h.raffle->getRecentWinner() != Identity("player2") ||
        winners != std::vector<Identity>{ "player2" }) {
        fail("winner not recorded despite the failed payout");
    }
    if (h.raffle->getUnpaidPrize("player2") != h.fee() * 3) {
        fail("prize not held as unpaid");
    }
    if (h.ledger->transferCount() != 0) {
        fail("funds moved despite the failure");
    }

    // The raffle stays usable.
    h.raffle->enter("fresh", h.fee());
    if (h.raffle->getBalance() != h.fee()) {
        fail("new round pool mixed with the unpaid prize");
    }

    if (h.raffle->retryUnpaidPrize("player2")) {
        fail("retry succeeded while the ledger still fails");
    }
    h.ledger->setFailing(false);
    if (!h.raffle->retryUnpaidPrize("player2")) {
        fail("retry failed after the ledger recovered");
    }
    if (h.ledger->balanceOf("player2") != h.fee() * 3 ||
        !h.raffle->getUnpaidPrize("player2").isZero()) {
        fail("retry did not settle the held prize");
    }

    bool nothingLeft = false;
    try {
        h.raffle->retryUnpaidPrize("player2");
    } catch (const NoUnpaidPrize&) {
        nothingLeft = true;
    }
    if (!nothingLeft) {
        fail("settled prize could be paid twice");
    }
}

void throwingGatewayCountsAsFailure() {
    auto oracle = std::make_shared<LocalVrfOracle>(rf::test::kOracleSeedHex);
    Timestamp start = Timestamp(std::chrono::seconds(1'700'000'000));
    Timestamp now = start;
    RaffleConfig cfg;
    Raffle raffle(cfg, oracle, std::make_shared<ThrowingGateway>(), start, [&now]() { return now; });

    raffle.enter("solo", cfg.entranceFee);
    now += 31s;
    RequestToken token = raffle.requestDraw(now);
    oracle->advanceBlocks(3);

    bool caught = false;
    try {
        oracle->fulfill(token, raffle);
    } catch (const PayoutFailed&) {
        caught = true;
    }
    if (!caught || raffle.getUnpaidPrize("solo") != cfg.entranceFee) {
        fail("gateway exception was not reported as PayoutFailed");
    }
}

void oracleFailureLeavesRoundCalculating() {
    RaffleHarness h;
    h.enterPlayers(2);
    h.advance(31s);
    h.oracle->setUnavailable(true);

    bool caught = false;
    try {
        h.raffle->requestDraw(h.now);
    } catch (const OracleRequestFailed&) {
        caught = true;
    }
    if (!caught) {
        fail("oracle failure was not reported");
    }
    if (h.raffle->getRaffleState() != RoundPhase::CALCULATING || h.raffle->getPendingRequest()) {
        fail("round should be CALCULATING without a token after an oracle failure");
    }
    if (h.raffle->checkUpkeep(h.now)) {
        fail("stalled round reported upkeep");
    }
    bool closed = false;
    try {
        h.raffle->enter("late", h.fee());
    } catch (const RoundNotOpen&) {
        closed = true;
    }
    if (!closed) {
        fail("entry admitted while the request is stalled");
    }

    h.raffle->abandonFailedRequest();
    if (h.raffle->getRaffleState() != RoundPhase::OPEN || h.raffle->getNumberOfPlayers() != 2 ||
        h.raffle->getBalance() != h.fee() * 2) {
        fail("abandoning the failed request lost entrants or funds");
    }

    h.oracle->setUnavailable(false);
    RequestToken token = h.raffle->requestDraw(h.now);
    if (!h.phaseMatchesToken() || h.raffle->getPendingRequest() != token) {
        fail("retry after recovery did not bind a token");
    }

    bool refused = false;
    try {
        h.raffle->abandonFailedRequest();
    } catch (const NoStalledRequest&) {
        refused = true;
    }
    if (!refused) {
        fail("a healthy outstanding request could be abandoned");
    }
}

} // namespace

int main() {
    failedTransferCommitsResetAndHoldsPrize();
    throwingGatewayCountsAsFailure();
    gatewayMayReadTheRaffleDuringTransfer();
    throwingObserverDoesNotMaskPayoutFailure();
    oracleFailureLeavesRoundCalculating();

    std::cout << "payout_failure_test passed" << std::endl;
    return 0;
}
