#pragma once

#include "amount.hpp"
#include "draw_context.hpp"
#include "round_state.hpp"

#include <chrono>
#include <cstddef>

namespace rf {

struct UpkeepStatus {
    bool upkeepNeeded = false;
    Amount balance;
    std::size_t numPlayers = 0;
    RoundPhase phase = RoundPhase::OPEN;
};

// Pure: reads the context, never mutates it.
UpkeepStatus evaluateUpkeep(const DrawContext& ctx, std::chrono::seconds interval, Timestamp now);

} // namespace rf
