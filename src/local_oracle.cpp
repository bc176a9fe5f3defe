#include "local_oracle.hpp"

#include "hex_codec.hpp"
#include "logger.hpp"

#include "picosha2.h"

#include <algorithm>
#include <array>
#include <sstream>
#include <stdexcept>
#include <string_view>

#include <sodium.h>

namespace rf {

#ifndef crypto_vrf_PROOFBYTES
#error "libsodium must provide crypto_vrf_* support (version >= 1.0.18)"
#endif

namespace {

constexpr std::string_view kVrfDomainTag = "raffle:vrf:v1";

log::Logger logger() {
    static log::Logger instance = log::createLogger("oracle");
    return instance;
}

void requireSodium() {
    static const int initResult = sodium_init();
    if (initResult < 0) {
        throw std::runtime_error("Unable to initialize libsodium");
    }
}

VrfKeyPair encodeKeypair(std::vector<unsigned char>& publicKey,
                         std::vector<unsigned char>& secretKey) {
    VrfKeyPair pair{ hex::encode(publicKey), hex::encode(secretKey) };
    sodium_memzero(secretKey.data(), secretKey.size());
    return pair;
}

void validateRequest(const RandomnessRequest& request) {
    if (request.keyHash.empty()) {
        throw std::invalid_argument("Randomness request is missing a key hash");
    }
    if (request.requestConfirmations < LocalVrfOracle::kMinimumConfirmations) {
        throw std::invalid_argument("Randomness request asks for too few confirmations");
    }
    if (request.numWords == 0 || request.numWords > LocalVrfOracle::kMaxNumWords) {
        throw std::invalid_argument("Randomness request word count out of range");
    }
    if (request.callbackGasLimit > LocalVrfOracle::kMaxCallbackGasLimit) {
        throw std::invalid_argument("Randomness request callback gas limit too high");
    }
}

} // namespace

LocalVrfOracle::LocalVrfOracle() {
    requireSodium();
    std::vector<unsigned char> publicKey(crypto_vrf_PUBLICKEYBYTES);
    secretKey_.resize(crypto_vrf_SECRETKEYBYTES);
    crypto_vrf_keypair(publicKey.data(), secretKey_.data());
    publicKeyHex_ = hex::encode(publicKey);
}

LocalVrfOracle::LocalVrfOracle(const std::string& keySeedHex) {
    requireSodium();
    auto seed = hex::decode(keySeedHex);
    if (seed.size() != crypto_vrf_SEEDBYTES) {
        sodium_memzero(seed.data(), seed.size());
        throw std::invalid_argument("Oracle key seed must decode to crypto_vrf_SEEDBYTES bytes");
    }
    std::vector<unsigned char> publicKey(crypto_vrf_PUBLICKEYBYTES);
    secretKey_.resize(crypto_vrf_SECRETKEYBYTES);
    int rc = crypto_vrf_keypair_from_seed(publicKey.data(), secretKey_.data(), seed.data());
    sodium_memzero(seed.data(), seed.size());
    if (rc != 0) {
        throw std::runtime_error("Failed to derive oracle VRF keypair from seed");
    }
    publicKeyHex_ = hex::encode(publicKey);
}

LocalVrfOracle::~LocalVrfOracle() {
    if (!secretKey_.empty()) {
        sodium_memzero(secretKey_.data(), secretKey_.size());
    }
}

RequestToken LocalVrfOracle::submitRequest(const RandomnessRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (unavailable_) {
        throw std::runtime_error("Randomness oracle unavailable");
    }
    validateRequest(request);

    RequestToken token = nextToken_++;
    pending_.emplace(token, PendingRequest{ request, currentBlock_ });
    logger()->debug("accepted request {} at block {} ({} confirmations, {} words)",
                    token,
                    currentBlock_,
                    request.requestConfirmations,
                    request.numWords);
    return token;
}

void LocalVrfOracle::advanceBlocks(std::uint64_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    currentBlock_ += count;
}

std::uint64_t LocalVrfOracle::currentBlock() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentBlock_;
}

bool LocalVrfOracle::isPending(RequestToken token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.count(token) != 0;
}

bool LocalVrfOracle::isReady(RequestToken token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(token);
    if (it == pending_.end()) {
        return false;
    }
    return currentBlock_ - it->second.blockRequested >= it->second.request.requestConfirmations;
}

std::size_t LocalVrfOracle::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

void LocalVrfOracle::setUnavailable(bool unavailable) {
    std::lock_guard<std::mutex> lock(mutex_);
    unavailable_ = unavailable;
}

const LocalVrfOracle::PendingRequest& LocalVrfOracle::readyRequest(RequestToken token) const {
    auto it = pending_.find(token);
    if (it == pending_.end()) {
        throw std::invalid_argument("nonexistent request " + std::to_string(token));
    }
    const auto& pending = it->second;
    if (currentBlock_ - pending.blockRequested < pending.request.requestConfirmations) {
        throw std::runtime_error("request " + std::to_string(token) +
                                 " is still waiting for confirmations");
    }
    return pending;
}

FulfillmentProof LocalVrfOracle::fulfill(RequestToken token, FulfillmentConsumer& consumer) {
    FulfillmentProof proof;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const RandomnessRequest request = readyRequest(token).request;
        proof.token = token;
        proof.alpha = buildAlpha(request.keyHash, request.subscriptionId, token);

        std::vector<unsigned char> vrfProof(crypto_vrf_PROOFBYTES);
        if (crypto_vrf_prove(vrfProof.data(),
                             secretKey_.data(),
                             reinterpret_cast<const unsigned char*>(proof.alpha.data()),
                             proof.alpha.size()) != 0) {
            throw std::runtime_error("VRF prove failed");
        }
        std::vector<unsigned char> vrfOutput(crypto_vrf_OUTPUTBYTES);
        if (crypto_vrf_proof_to_hash(vrfOutput.data(), vrfProof.data()) != 0) {
            throw std::runtime_error("VRF hash extraction failed");
        }
        proof.vrfProofHex = hex::encode(vrfProof);
        proof.vrfOutputHex = hex::encode(vrfOutput);
        proof.words = deriveWords(proof.vrfOutputHex, request.numWords);

        // Only a completed proof consumes the request.
        pending_.erase(token);
    }

    logger()->info("fulfilling request {} with VRF output {}", token, proof.vrfOutputHex);
    consumer.fulfillRandomWords(token, proof.words);
    return proof;
}

void LocalVrfOracle::fulfillWithWords(RequestToken token,
                                      const std::vector<RandomWord>& words,
                                      FulfillmentConsumer& consumer) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto& pending = readyRequest(token);
        if (!words.empty() && words.size() != pending.request.numWords) {
            throw std::invalid_argument("word count does not match the request");
        }
        pending_.erase(token);
    }
    logger()->info("fulfilling request {} with {} fixed words", token, words.size());
    consumer.fulfillRandomWords(token, words);
}

std::string LocalVrfOracle::buildAlpha(const std::string& keyHash,
                                       std::uint64_t subscriptionId,
                                       RequestToken token) {
    std::ostringstream oss;
    oss << kVrfDomainTag << "|" << keyHash << "|" << subscriptionId << ":" << token;
    return oss.str();
}

std::vector<RandomWord> LocalVrfOracle::deriveWords(const std::string& vrfOutputHex,
                                                    std::uint32_t numWords) {
    std::vector<RandomWord> words;
    words.reserve(numWords);
    for (std::uint32_t i = 0; i < numWords; ++i) {
        std::ostringstream oss;
        oss << kVrfDomainTag << "|" << vrfOutputHex << ':' << i;
        std::string input = oss.str();

        std::array<unsigned char, 32> digest{};
        picosha2::hash256(input.begin(), input.end(), digest.begin(), digest.end());

        RandomWord word;
        boost::multiprecision::import_bits(word, digest.begin(), digest.end());
        words.push_back(word);
    }
    return words;
}

bool LocalVrfOracle::verify(const FulfillmentProof& proof, const std::string& publicKeyHex) {
    requireSodium();
    try {
        auto vrfProof = hex::decode(proof.vrfProofHex);
        auto publicKey = hex::decode(publicKeyHex);
        auto output = hex::decode(proof.vrfOutputHex);
        if (vrfProof.size() != crypto_vrf_PROOFBYTES ||
            output.size() != crypto_vrf_OUTPUTBYTES ||
            publicKey.size() != crypto_vrf_PUBLICKEYBYTES) {
            return false;
        }

        std::vector<unsigned char> recomputed(crypto_vrf_OUTPUTBYTES);
        if (crypto_vrf_verify(recomputed.data(),
                              publicKey.data(),
                              vrfProof.data(),
                              reinterpret_cast<const unsigned char*>(proof.alpha.data()),
                              proof.alpha.size()) != 0) {
            return false;
        }
        if (!std::equal(recomputed.begin(), recomputed.end(), output.begin())) {
            return false;
        }

        auto expectedWords =
            deriveWords(proof.vrfOutputHex, static_cast<std::uint32_t>(proof.words.size()));
        return expectedWords == proof.words;
    } catch (const std::invalid_argument&) {
        return false;
    }
}

std::string generateKeySeed() {
    requireSodium();
    std::vector<unsigned char> seed(crypto_vrf_SEEDBYTES);
    randombytes_buf(seed.data(), seed.size());
    std::string hex = hex::encode(seed);
    sodium_memzero(seed.data(), seed.size());
    return hex;
}

VrfKeyPair deriveVrfKeypairFromSeed(const std::string& seedHex) {
    requireSodium();

    auto seed = hex::decode(seedHex);
    if (seed.size() != crypto_vrf_SEEDBYTES) {
        throw std::invalid_argument("Seed must decode to crypto_vrf_SEEDBYTES bytes");
    }

    std::vector<unsigned char> publicKey(crypto_vrf_PUBLICKEYBYTES);
    std::vector<unsigned char> secretKey(crypto_vrf_SECRETKEYBYTES);
    int rc = crypto_vrf_keypair_from_seed(publicKey.data(), secretKey.data(), seed.data());
    sodium_memzero(seed.data(), seed.size());
    if (rc != 0) {
        throw std::runtime_error("Failed to derive VRF keypair from seed");
    }
    return encodeKeypair(publicKey, secretKey);
}

} // namespace rf
