#include "round_journal.hpp"

#include "picosha2.h"

#include <algorithm>
#include <vector>

namespace rf {

void RoundJournal::append(const std::string& event) {
    leaves_.push_back(hash(event));
}

std::string RoundJournal::getLeaf(std::size_t index) const {
    if (index >= leaves_.size()) {
        return {};
    }
    return leaves_[index];
}

std::string RoundJournal::hash(const std::string& data) {
    std::vector<unsigned char> digest(picosha2::k_digest_size);
    picosha2::hash256(data.begin(), data.end(), digest.begin(), digest.end());
    return picosha2::bytes_to_hex_string(digest.begin(), digest.end());
}

std::string RoundJournal::hashPair(const std::string& left, const std::string& right) {
    return hash(left + right);
}

std::vector<std::string> RoundJournal::parentLevel(const std::vector<std::string>& level) {
    std::vector<std::string> parents;
    parents.reserve((level.size() + 1) / 2);
    for (std::size_t left = 0; left < level.size(); left += 2) {
        std::size_t right = std::min(left + 1, level.size() - 1);
        parents.push_back(hashPair(level[left], level[right]));
    }
    return parents;
}

std::string RoundJournal::merkleRoot() const {
    if (leaves_.empty()) {
        return {};
    }
    std::vector<std::string> level = leaves_;
    while (level.size() > 1) {
        level = parentLevel(level);
    }
    return level.front();
}

std::vector<std::string> RoundJournal::merkleProof(std::size_t leafIndex) const {
    if (leafIndex >= leaves_.size()) {
        return {};
    }

    std::vector<std::string> proof;
    std::vector<std::string> level = leaves_;
    for (std::size_t index = leafIndex; level.size() > 1; index /= 2) {
        std::size_t sibling = index ^ 1;
        proof.push_back(level[sibling < level.size() ? sibling : index]);
        level = parentLevel(level);
    }
    return proof;
}

bool RoundJournal::verifyProof(const std::string& event,
                               std::size_t leafIndex,
                               const std::vector<std::string>& proof,
                               const std::string& root) {
    if (root.empty()) {
        return false;
    }
    std::string current = hash(event);
    std::size_t index = leafIndex;
    for (const auto& sibling : proof) {
        current = (index % 2 == 0) ? hashPair(current, sibling) : hashPair(sibling, current);
        index /= 2;
    }
    return index == 0 && current == root;
}

void RoundJournal::clear() {
    leaves_.clear();
}

} // namespace rf
