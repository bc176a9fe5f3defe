#include "randomness_requester.hpp"

#include "eligibility.hpp"
#include "errors.hpp"
#include "logger.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

namespace rf {

namespace {

log::Logger logger() {
    static log::Logger instance = log::createLogger("requester");
    return instance;
}

} // namespace

RandomnessRequester::RandomnessRequester(RaffleConfig cfg, OraclePtr oracle)
    : config_(std::move(cfg))
    , oracle_(std::move(oracle)) {
    if (!oracle_) {
        throw std::invalid_argument("RandomnessRequester requires an oracle");
    }
}

RandomnessRequest RandomnessRequester::buildRequest() const {
    RandomnessRequest request;
    request.keyHash = config_.oracle.keyHash;
    request.subscriptionId = config_.oracle.subscriptionId;
    request.requestConfirmations = OracleConfig::kRequestConfirmations;
    request.callbackGasLimit = config_.oracle.callbackGasLimit;
    request.numWords = OracleConfig::kNumWords;
    return request;
}

RequestToken RandomnessRequester::requestDraw(DrawContext& ctx, Timestamp now) {
    UpkeepStatus status = evaluateUpkeep(ctx, config_.interval, now);
    if (!status.upkeepNeeded) {
        logger()->debug("round {} not eligible (balance={}, players={}, phase={})",
                        ctx.round.roundNumber,
                        status.balance.toString(),
                        status.numPlayers,
                        toString(status.phase));
        throw UpkeepNotNeeded(status.balance, status.numPlayers, status.phase);
    }

    // No entry or second request may slip in while the oracle call is out.
    ctx.round.beginCalculating();

    RequestToken token = 0;
    try {
        token = oracle_->submitRequest(buildRequest());
    } catch (const std::exception& ex) {
        logger()->error("round {} randomness request failed: {}", ctx.round.roundNumber, ex.what());
        throw OracleRequestFailed(std::string("Randomness request failed: ") + ex.what());
    }

    ctx.round.bindRequest(token);

    std::ostringstream event;
    event << "request|" << ctx.round.roundNumber << "|" << token;
    ctx.journal.append(event.str());

    logger()->info("round {} requested randomness, token {}", ctx.round.roundNumber, token);
    return token;
}

} // namespace rf
