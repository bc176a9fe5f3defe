#pragma once

#include "amount.hpp"
#include "draw_context.hpp"
#include "raffle_types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace rf {

struct DrawResult {
    RequestToken token = 0;
    std::uint64_t roundNumber = 0;
    std::size_t winningIndex = 0;
    Identity winner;
    Amount prize;
    bool paid = false;
    // Root over the closed round's journal, fulfillment included.
    std::string journalRoot;
};

class WinnerResolver {
public:
    // Rejects mismatched tokens with UnknownOrStaleRequest and empty draws with
    // InvalidFulfillment, both without touching ctx. Otherwise commits the
    // reset and takes the prize out of the pool; the caller transfers it and
    // sets DrawResult::paid.
    DrawResult resolve(DrawContext& ctx,
                       RequestToken token,
                       const std::vector<RandomWord>& words,
                       Timestamp closedAt);

    static std::size_t selectIndex(const RandomWord& word, std::size_t numPlayers);
};

} // namespace rf
