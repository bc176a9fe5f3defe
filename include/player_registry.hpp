#pragma once

#include "amount.hpp"
#include "raffle_types.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace rf {

struct Entrant {
    Identity identity;
    Amount feePaid;
};

// Entrants of the current round in admission order. The order is the index
// space used for winner selection.
class PlayerRegistry {
public:
    void append(Entrant entrant);
    std::optional<Entrant> at(std::size_t index) const;
    const std::vector<Entrant>& entrants() const { return entrants_; }
    std::size_t size() const { return entrants_.size(); }
    bool empty() const { return entrants_.empty(); }
    void clear();

private:
    std::vector<Entrant> entrants_;
};

} // namespace rf
