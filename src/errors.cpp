#include "errors.hpp"

#include <sstream>
#include <utility>

namespace rf {

namespace {

std::string describeInsufficientFee(Amount paid, Amount required) {
    std::ostringstream oss;
    oss << "Insufficient entrance fee: paid " << paid.toString() << ", required "
        << required.toString();
    return oss.str();
}

std::string describeUpkeep(Amount balance, std::size_t numPlayers, RoundPhase phase) {
    std::ostringstream oss;
    oss << "Upkeep not needed (balance=" << balance.toString() << ", numPlayers=" << numPlayers
        << ", phase=" << toString(phase) << ")";
    return oss.str();
}

} // namespace

InsufficientFee::InsufficientFee(Amount paid, Amount required)
    : RaffleError(describeInsufficientFee(paid, required))
    , paid_(paid)
    , required_(required) {}

RoundNotOpen::RoundNotOpen(RoundPhase phase)
    : RaffleError(std::string("Round is not open (phase=") + toString(phase) + ")")
    , phase_(phase) {}

UpkeepNotNeeded::UpkeepNotNeeded(Amount balance, std::size_t numPlayers, RoundPhase phase)
    : RaffleError(describeUpkeep(balance, numPlayers, phase))
    , balance_(balance)
    , numPlayers_(numPlayers)
    , phase_(phase) {}

UnknownOrStaleRequest::UnknownOrStaleRequest(RequestToken token)
    : RaffleError("Fulfillment for unknown or stale request " + std::to_string(token))
    , token_(token) {}

PayoutFailed::PayoutFailed(Identity winner, Amount amount)
    : RaffleError("Payout of " + amount.toString() + " to " + winner + " failed")
    , winner_(std::move(winner))
    , amount_(amount) {}

NoUnpaidPrize::NoUnpaidPrize(const Identity& identity)
    : RaffleError("No unpaid prize held for " + identity) {}

} // namespace rf
