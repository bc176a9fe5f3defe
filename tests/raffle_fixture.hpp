#pragma once

#include "config.hpp"
#include "local_oracle.hpp"
#include "payout_gateway.hpp"
#include "raffle.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <utility>

namespace rf::test {

// Fixed oracle key so every run derives the same VRF outputs.
inline const char* kOracleSeedHex =
    "000102030405060708090a0b0c0d0e0f000102030405060708090a0b0c0d0e0f";

// A raffle wired to the local oracle and an in-memory ledger, driven by a
// manual clock.
struct RaffleHarness {
    Timestamp start = Timestamp(std::chrono::seconds(1'700'000'000));
    Timestamp now = start;
    RaffleConfig cfg;
    std::shared_ptr<LocalVrfOracle> oracle;
    std::shared_ptr<InMemoryLedger> ledger;
    std::unique_ptr<Raffle> raffle;

    explicit RaffleHarness(RaffleConfig config = RaffleConfig())
        : cfg(std::move(config))
        , oracle(std::make_shared<LocalVrfOracle>(kOracleSeedHex))
        , ledger(std::make_shared<InMemoryLedger>())
        , raffle(std::make_unique<Raffle>(cfg, oracle, ledger, start, [this]() { return now; })) {}

    RaffleHarness(const RaffleHarness&) = delete;
    RaffleHarness& operator=(const RaffleHarness&) = delete;

    void advance(std::chrono::seconds delta) { now += delta; }
    Amount fee() const { return cfg.entranceFee; }

    // Enters `count` players named player0..playerN-1 at the exact fee.
    void enterPlayers(std::size_t count) {
        for (std::size_t i = 0; i < count; ++i) {
            raffle->enter("player" + std::to_string(i), cfg.entranceFee);
        }
    }

    RequestToken closeRound() {
        advance(cfg.interval + std::chrono::seconds(1));
        return raffle->requestDraw(now);
    }

    bool phaseMatchesToken() const {
        bool calculating = raffle->getRaffleState() == RoundPhase::CALCULATING;
        return calculating == raffle->getPendingRequest().has_value();
    }
};

} // namespace rf::test
