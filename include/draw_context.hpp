#pragma once

#include "player_registry.hpp"
#include "raffle_types.hpp"
#include "round_journal.hpp"
#include "round_state.hpp"
#include "treasury.hpp"

#include <optional>

namespace rf {

// Everything one raffle mutates, owned in one place and guarded by the
// owner's single lock.
struct DrawContext {
    RoundState round;
    PlayerRegistry players;
    Treasury treasury;
    std::optional<Identity> recentWinner;
    RoundJournal journal;

    explicit DrawContext(Timestamp startedAt)
        : round(startedAt) {}
};

} // namespace rf
