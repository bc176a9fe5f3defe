#pragma once

#include "config.hpp"
#include "draw_context.hpp"
#include "oracle.hpp"

namespace rf {

// Closes the round and asks the oracle for the words that will pick the winner.
class RandomnessRequester {
public:
    RandomnessRequester(RaffleConfig cfg, OraclePtr oracle);

    // Throws UpkeepNotNeeded when the round is not eligible, and
    // OracleRequestFailed when the oracle refuses the request (the round then
    // stays CALCULATING without a token).
    RequestToken requestDraw(DrawContext& ctx, Timestamp now);

    RandomnessRequest buildRequest() const;

private:
    RaffleConfig config_;
    OraclePtr oracle_;
};

} // namespace rf
