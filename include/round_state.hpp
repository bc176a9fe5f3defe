#pragma once

#include "raffle_types.hpp"

#include <cstdint>
#include <optional>

namespace rf {

enum class RoundPhase { OPEN, CALCULATING };

const char* toString(RoundPhase phase);

// The live round. pendingRequestToken is bound only while CALCULATING.
struct RoundState {
    RoundPhase phase = RoundPhase::OPEN;
    Timestamp lastDrawTimestamp{};
    std::optional<RequestToken> pendingRequestToken;
    std::uint64_t roundNumber = 1;

    explicit RoundState(Timestamp startedAt) : lastDrawTimestamp(startedAt) {}

    void beginCalculating();
    void bindRequest(RequestToken token);
    void reopen(Timestamp closedAt);
    // Leaves a CALCULATING round whose oracle submission never produced a token.
    void abandonUnboundRequest();

    bool awaiting(RequestToken token) const {
        return phase == RoundPhase::CALCULATING && pendingRequestToken &&
               *pendingRequestToken == token;
    }
};

} // namespace rf
