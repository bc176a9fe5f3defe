#include "local_oracle.hpp"
#include "winner_resolver.hpp"

#include <cstdint>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 8) {
        std::cerr << "Usage: verify_draw <vrfOutputHex> <vrfProofHex> <publicKeyHex> <keyHash> "
                     "<subscriptionId> <token> <numPlayers>\n";
        return 1;
    }

    rf::FulfillmentProof proof;
    proof.vrfOutputHex = argv[1];
    proof.vrfProofHex = argv[2];
    std::string publicKey = argv[3];
    std::string keyHash = argv[4];
    std::uint64_t subscriptionId = 0;
    std::size_t numPlayers = 0;
    try {
        subscriptionId = std::stoull(argv[5]);
        proof.token = std::stoull(argv[6]);
        numPlayers = static_cast<std::size_t>(std::stoull(argv[7]));
    } catch (const std::exception& ex) {
        std::cerr << "subscriptionId, token and numPlayers must be unsigned integers: " << ex.what()
                  << '\n';
        return 1;
    }
    if (numPlayers == 0) {
        std::cerr << "numPlayers must be positive\n";
        return 1;
    }

    proof.alpha = rf::LocalVrfOracle::buildAlpha(keyHash, subscriptionId, proof.token);
    proof.words = rf::LocalVrfOracle::deriveWords(proof.vrfOutputHex, 1);

    bool ok = rf::LocalVrfOracle::verify(proof, publicKey);
    std::cout << "VRF verification: " << (ok ? "valid" : "INVALID") << '\n';
    if (!ok) {
        return 2;
    }

    const auto& word = proof.words.front();
    std::cout << "Random word: 0x" << word.str(0, std::ios_base::hex) << '\n';
    std::cout << "Winning index: " << rf::WinnerResolver::selectIndex(word, numPlayers) << " of "
              << numPlayers << '\n';
    return 0;
}
