#include "winner_resolver.hpp"

#include "errors.hpp"
#include "logger.hpp"

#include <sstream>
#include <stdexcept>

namespace rf {

namespace {

log::Logger logger() {
    static log::Logger instance = log::createLogger("resolver");
    return instance;
}

std::string fulfillmentEvent(std::uint64_t roundNumber,
                             RequestToken token,
                             const RandomWord& word,
                             std::size_t index,
                             const Entrant& winner,
                             Amount prize) {
    std::ostringstream oss;
    oss << "fulfill|" << roundNumber << "|" << token << "|" << word.str(0, std::ios_base::hex)
        << "|" << index << "|" << winner.identity << "|" << prize.micros();
    return oss.str();
}

} // namespace

std::size_t WinnerResolver::selectIndex(const RandomWord& word, std::size_t numPlayers) {
    if (numPlayers == 0) {
        throw std::invalid_argument("Cannot select from an empty registry");
    }
    RandomWord index = word % RandomWord(numPlayers);
    return index.convert_to<std::size_t>();
}

DrawResult WinnerResolver::resolve(DrawContext& ctx,
                                   RequestToken token,
                                   const std::vector<RandomWord>& words,
                                   Timestamp closedAt) {
    if (!ctx.round.awaiting(token)) {
        logger()->warn("rejecting fulfillment for token {} (phase={})",
                       token,
                       toString(ctx.round.phase));
        throw UnknownOrStaleRequest(token);
    }
    if (words.empty()) {
        throw InvalidFulfillment("Fulfillment carried no random words");
    }
    if (ctx.players.empty()) {
        throw InvalidFulfillment("No entrants to draw a winner from");
    }

    DrawResult result;
    result.token = token;
    result.roundNumber = ctx.round.roundNumber;
    result.winningIndex = selectIndex(words.front(), ctx.players.size());
    const Entrant winner = ctx.players.entrants()[result.winningIndex];
    result.winner = winner.identity;
    result.prize = ctx.treasury.balance();

    ctx.journal.append(fulfillmentEvent(
        result.roundNumber, token, words.front(), result.winningIndex, winner, result.prize));
    result.journalRoot = ctx.journal.merkleRoot();

    ctx.recentWinner = winner.identity;
    ctx.round.reopen(closedAt);
    ctx.players.clear();
    ctx.journal.clear();
    ctx.treasury.withdraw(result.prize);

    logger()->info("round {} winner {} at index {} of prize {}",
                   result.roundNumber,
                   result.winner,
                   result.winningIndex,
                   result.prize.toString());
    return result;
}

} // namespace rf
