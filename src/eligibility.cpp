#include "eligibility.hpp"

namespace rf {

UpkeepStatus evaluateUpkeep(const DrawContext& ctx, std::chrono::seconds interval, Timestamp now) {
    UpkeepStatus status;
    status.balance = ctx.treasury.balance();
    status.numPlayers = ctx.players.size();
    status.phase = ctx.round.phase;

    const bool timePassed =
        now >= ctx.round.lastDrawTimestamp && (now - ctx.round.lastDrawTimestamp) >= interval;
    const bool isOpen = status.phase == RoundPhase::OPEN;
    const bool hasBalance = !status.balance.isZero();
    const bool hasPlayers = status.numPlayers > 0;

    status.upkeepNeeded = timePassed && isOpen && hasBalance && hasPlayers;
    return status;
}

} // namespace rf
