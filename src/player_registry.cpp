#include "player_registry.hpp"

#include <utility>

namespace rf {

void PlayerRegistry::append(Entrant entrant) {
    entrants_.push_back(std::move(entrant));
}

std::optional<Entrant> PlayerRegistry::at(std::size_t index) const {
    if (index >= entrants_.size()) {
        return std::nullopt;
    }
    return entrants_[index];
}

void PlayerRegistry::clear() {
    entrants_.clear();
    entrants_.shrink_to_fit();
}

} // namespace rf
