#pragma once

#include "oracle.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace rf {

struct VrfKeyPair {
    std::string publicKeyHex;
    std::string secretKeyHex;
};

// Everything needed to check a local fulfillment after the fact.
struct FulfillmentProof {
    RequestToken token = 0;
    std::string alpha;
    std::string vrfProofHex;
    std::string vrfOutputHex;
    std::vector<RandomWord> words;
};

// In-process randomness oracle backed by a libsodium VRF key. Requests wait
// for simulated block confirmations before they can be fulfilled.
class LocalVrfOracle : public RandomnessOracle {
public:
    static constexpr std::uint16_t kMinimumConfirmations = 3;
    static constexpr std::uint32_t kMaxNumWords = 500;
    static constexpr std::uint32_t kMaxCallbackGasLimit = 2'500'000;

    LocalVrfOracle();
    explicit LocalVrfOracle(const std::string& keySeedHex);
    ~LocalVrfOracle() override;

    LocalVrfOracle(const LocalVrfOracle&) = delete;
    LocalVrfOracle& operator=(const LocalVrfOracle&) = delete;

    RequestToken submitRequest(const RandomnessRequest& request) override;

    void advanceBlocks(std::uint64_t count);
    std::uint64_t currentBlock() const;
    bool isPending(RequestToken token) const;
    bool isReady(RequestToken token) const;
    std::size_t pendingCount() const;
    // While unavailable, submitRequest throws std::runtime_error.
    void setUnavailable(bool unavailable);

    FulfillmentProof fulfill(RequestToken token, FulfillmentConsumer& consumer);
    // Delivers caller-chosen words; confirmations still apply.
    void fulfillWithWords(RequestToken token,
                          const std::vector<RandomWord>& words,
                          FulfillmentConsumer& consumer);

    const std::string& getPublicKey() const { return publicKeyHex_; }

    static std::string buildAlpha(const std::string& keyHash,
                                  std::uint64_t subscriptionId,
                                  RequestToken token);
    static std::vector<RandomWord> deriveWords(const std::string& vrfOutputHex,
                                               std::uint32_t numWords);
    static bool verify(const FulfillmentProof& proof, const std::string& publicKeyHex);

private:
    struct PendingRequest {
        RandomnessRequest request;
        std::uint64_t blockRequested = 0;
    };

    // Throws unless the request exists and has its confirmations.
    const PendingRequest& readyRequest(RequestToken token) const;

    mutable std::mutex mutex_;
    std::vector<unsigned char> secretKey_;
    std::string publicKeyHex_;
    std::map<RequestToken, PendingRequest> pending_;
    RequestToken nextToken_ = 1;
    std::uint64_t currentBlock_ = 0;
    bool unavailable_ = false;
};

std::string generateKeySeed();
VrfKeyPair deriveVrfKeypairFromSeed(const std::string& seedHex);

} // namespace rf
