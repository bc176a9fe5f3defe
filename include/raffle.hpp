#pragma once

#include "amount.hpp"
#include "config.hpp"
#include "draw_context.hpp"
#include "oracle.hpp"
#include "payout_gateway.hpp"
#include "raffle_types.hpp"
#include "randomness_requester.hpp"
#include "round_state.hpp"
#include "winner_resolver.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rf {

struct RaffleEvents {
    std::function<void(const Identity&)> onEnteredRound;
    std::function<void(RequestToken)> onDrawRequested;
    std::function<void(const Identity&)> onWinnerPicked;
};

// The raffle as seen by entrants, the keeper and the oracle. Every operation
// runs under one lock. Event callbacks and payout gateway calls run after it
// is released, so both may call back into the raffle. A callback that throws
// is logged and does not affect the operation that raised the event.
class Raffle : public FulfillmentConsumer {
public:
    using Clock = std::function<Timestamp()>;

    Raffle(RaffleConfig cfg,
           OraclePtr oracle,
           PayoutGatewayPtr gateway,
           Timestamp startedAt,
           Clock clock = {});

    void setEvents(RaffleEvents events);

    void enter(const Identity& identity, Amount feePaid);
    bool checkUpkeep(Timestamp now) const;
    RequestToken requestDraw(Timestamp now);
    // Throws PayoutFailed after the round has been reset if the prize could
    // not be transferred; the prize is then held for retryUnpaidPrize.
    void fulfillRandomWords(RequestToken token, const std::vector<RandomWord>& words) override;

    bool retryUnpaidPrize(const Identity& identity);
    void abandonFailedRequest();

    Amount getEntranceFee() const { return config_.entranceFee; }
    std::chrono::seconds getInterval() const { return config_.interval; }
    static constexpr std::uint16_t getRequestConfirmations() {
        return OracleConfig::kRequestConfirmations;
    }
    static constexpr std::uint32_t getNumWords() { return OracleConfig::kNumWords; }

    RoundPhase getRaffleState() const;
    std::optional<Identity> getPlayer(std::size_t index) const;
    std::size_t getNumberOfPlayers() const;
    std::optional<Identity> getRecentWinner() const;
    Timestamp getLastTimeStamp() const;
    Amount getBalance() const;
    std::optional<RequestToken> getPendingRequest() const;
    std::uint64_t getRoundNumber() const;
    Amount getUnpaidPrize(const Identity& identity) const;
    std::string getJournalRoot() const;
    std::vector<std::string> getJournalProof(std::size_t index) const;
    std::optional<DrawResult> getLastDraw() const;

private:
    bool transferPrize(const Identity& winner, Amount prize) const;

    RaffleConfig config_;
    Clock clock_;
    RandomnessRequester requester_;
    WinnerResolver resolver_;
    PayoutGatewayPtr gateway_;

    mutable std::mutex mutex_;
    DrawContext ctx_;
    std::optional<DrawResult> lastDraw_;
    RaffleEvents events_;
};

} // namespace rf
