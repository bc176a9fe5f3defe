#include "raffle.hpp"

#include "eligibility.hpp"
#include "errors.hpp"
#include "logger.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

namespace rf {

namespace {

log::Logger logger() {
    static log::Logger instance = log::createLogger("raffle");
    return instance;
}

Timestamp systemNow() {
    return std::chrono::system_clock::now();
}

std::string entryEvent(std::uint64_t roundNumber, const Identity& identity, Amount feePaid) {
    std::ostringstream oss;
    oss << "enter|" << roundNumber << "|" << identity << "|" << feePaid.micros();
    return oss.str();
}

template <typename Callback, typename... Args>
void notifyObserver(const char* event, const Callback& callback, const Args&... args) {
    if (!callback) {
        return;
    }
    try {
        callback(args...);
    } catch (const std::exception& ex) {
        logger()->error("{} observer threw: {}", event, ex.what());
    }
}

} // namespace

Raffle::Raffle(RaffleConfig cfg,
               OraclePtr oracle,
               PayoutGatewayPtr gateway,
               Timestamp startedAt,
               Clock clock)
    : config_(std::move(cfg))
    , clock_(clock ? std::move(clock) : Clock(systemNow))
    , requester_(config_, std::move(oracle))
    , resolver_()
    , gateway_(std::move(gateway))
    , ctx_(startedAt) {
    if (!gateway_) {
        throw std::invalid_argument("Raffle requires a payout gateway");
    }
    validateConfig(config_);
    logger()->info("raffle open: fee={} interval={}s gas lane={}",
                   config_.entranceFee.toString(),
                   config_.interval.count(),
                   config_.oracle.keyHash);
}

void Raffle::setEvents(RaffleEvents events) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_ = std::move(events);
}

void Raffle::enter(const Identity& identity, Amount feePaid) {
    std::function<void(const Identity&)> notify;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (feePaid < config_.entranceFee) {
            throw InsufficientFee(feePaid, config_.entranceFee);
        }
        if (ctx_.round.phase != RoundPhase::OPEN) {
            throw RoundNotOpen(ctx_.round.phase);
        }
        if (identity.empty()) {
            throw InvalidEntrant("Entrant identity must not be empty");
        }

        try {
            ctx_.treasury.deposit(feePaid);
        } catch (const std::overflow_error&) {
            throw InvalidEntrant("Entry fee " + feePaid.toString() +
                                 " would overflow the prize pool");
        }
        ctx_.players.append(Entrant{ identity, feePaid });
        ctx_.journal.append(entryEvent(ctx_.round.roundNumber, identity, feePaid));
        notify = events_.onEnteredRound;

        logger()->debug("{} entered round {} paying {} ({} players)",
                        identity,
                        ctx_.round.roundNumber,
                        feePaid.toString(),
                        ctx_.players.size());
    }
    notifyObserver("EnteredRound", notify, identity);
}

bool Raffle::checkUpkeep(Timestamp now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return evaluateUpkeep(ctx_, config_.interval, now).upkeepNeeded;
}

RequestToken Raffle::requestDraw(Timestamp now) {
    RequestToken token = 0;
    std::function<void(RequestToken)> notify;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        token = requester_.requestDraw(ctx_, now);
        notify = events_.onDrawRequested;
    }
    notifyObserver("DrawRequested", notify, token);
    return token;
}

void Raffle::fulfillRandomWords(RequestToken token, const std::vector<RandomWord>& words) {
    DrawResult result;
    std::function<void(const Identity&)> notify;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result = resolver_.resolve(ctx_, token, words, clock_());
        notify = events_.onWinnerPicked;
    }

    result.paid = transferPrize(result.winner, result.prize);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!result.paid) {
            ctx_.treasury.holdUnpaid(result.winner, result.prize);
        }
        lastDraw_ = result;
    }

    notifyObserver("WinnerPicked", notify, result.winner);
    if (!result.paid) {
        throw PayoutFailed(result.winner, result.prize);
    }
}

bool Raffle::retryUnpaidPrize(const Identity& identity) {
    Amount prize;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        prize = ctx_.treasury.releaseUnpaid(identity);
    }

    if (transferPrize(identity, prize)) {
        return true;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    ctx_.treasury.holdUnpaid(identity, prize);
    return false;
}

bool Raffle::transferPrize(const Identity& winner, Amount prize) const {
    bool paid = false;
    try {
        paid = gateway_->transfer(winner, prize);
    } catch (const std::exception& ex) {
        logger()->error("payout gateway raised for {}: {}", winner, ex.what());
        return false;
    }
    if (paid) {
        logger()->info("paid {} to {}", prize.toString(), winner);
    } else {
        logger()->error("payout of {} to {} failed", prize.toString(), winner);
    }
    return paid;
}

void Raffle::abandonFailedRequest() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ctx_.round.phase != RoundPhase::CALCULATING || ctx_.round.pendingRequestToken) {
        throw NoStalledRequest("No failed randomness request to abandon");
    }
    ctx_.round.abandonUnboundRequest();
    logger()->warn("round {} reopened after a failed randomness request", ctx_.round.roundNumber);
}

RoundPhase Raffle::getRaffleState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ctx_.round.phase;
}

std::optional<Identity> Raffle::getPlayer(std::size_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto entrant = ctx_.players.at(index);
    if (!entrant) {
        return std::nullopt;
    }
    return entrant->identity;
}

std::size_t Raffle::getNumberOfPlayers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ctx_.players.size();
}

std::optional<Identity> Raffle::getRecentWinner() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ctx_.recentWinner;
}

Timestamp Raffle::getLastTimeStamp() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ctx_.round.lastDrawTimestamp;
}

Amount Raffle::getBalance() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ctx_.treasury.balance();
}

std::optional<RequestToken> Raffle::getPendingRequest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ctx_.round.pendingRequestToken;
}

std::uint64_t Raffle::getRoundNumber() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ctx_.round.roundNumber;
}

Amount Raffle::getUnpaidPrize(const Identity& identity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ctx_.treasury.unpaidFor(identity);
}

std::string Raffle::getJournalRoot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ctx_.journal.merkleRoot();
}

std::vector<std::string> Raffle::getJournalProof(std::size_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ctx_.journal.merkleProof(index);
}

std::optional<DrawResult> Raffle::getLastDraw() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastDraw_;
}

} // namespace rf
