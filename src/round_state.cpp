#include "round_state.hpp"

#include <stdexcept>

namespace rf {

const char* toString(RoundPhase phase) {
    switch (phase) {
    case RoundPhase::OPEN:
        return "OPEN";
    case RoundPhase::CALCULATING:
        return "CALCULATING";
    }
    return "UNKNOWN";
}

void RoundState::beginCalculating() {
    if (phase != RoundPhase::OPEN) {
        throw std::logic_error("Round can only start calculating from OPEN");
    }
    phase = RoundPhase::CALCULATING;
}

void RoundState::bindRequest(RequestToken token) {
    if (phase != RoundPhase::CALCULATING || pendingRequestToken) {
        throw std::logic_error("Request token can only be bound once per calculating round");
    }
    pendingRequestToken = token;
}

void RoundState::reopen(Timestamp closedAt) {
    phase = RoundPhase::OPEN;
    pendingRequestToken.reset();
    lastDrawTimestamp = closedAt;
    ++roundNumber;
}

void RoundState::abandonUnboundRequest() {
    if (phase != RoundPhase::CALCULATING || pendingRequestToken) {
        throw std::logic_error("Only a calculating round without a bound request can be abandoned");
    }
    phase = RoundPhase::OPEN;
}

} // namespace rf
