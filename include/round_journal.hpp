#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace rf {

// SHA-256 Merkle log of the events committed during the current round.
class RoundJournal {
public:
    void append(const std::string& event);
    std::string getLeaf(std::size_t index) const;

    std::string merkleRoot() const;
    std::vector<std::string> merkleProof(std::size_t leafIndex) const;
    static bool verifyProof(const std::string& event,
                            std::size_t leafIndex,
                            const std::vector<std::string>& proof,
                            const std::string& root);

    static std::string hash(const std::string& data);

    std::size_t size() const { return leaves_.size(); }
    void clear();

private:
    static std::string hashPair(const std::string& left, const std::string& right);
    // Hashes adjacent pairs; a trailing odd node is paired with itself.
    static std::vector<std::string> parentLevel(const std::vector<std::string>& level);

    std::vector<std::string> leaves_;
};

} // namespace rf
