#pragma once

#include "raffle_types.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace rf {

struct RandomnessRequest {
    std::string keyHash;
    std::uint64_t subscriptionId = 0;
    std::uint16_t requestConfirmations = 0;
    std::uint32_t callbackGasLimit = 0;
    std::uint32_t numWords = 0;
};

// Receives oracle answers. Implementations must match the token against the
// request they are waiting for.
class FulfillmentConsumer {
public:
    virtual ~FulfillmentConsumer() = default;
    virtual void fulfillRandomWords(RequestToken token, const std::vector<RandomWord>& words) = 0;
};

// External randomness service. submitRequest returns immediately with the
// correlation token; the answer arrives later through a FulfillmentConsumer,
// never from inside submitRequest.
class RandomnessOracle {
public:
    virtual ~RandomnessOracle() = default;
    virtual RequestToken submitRequest(const RandomnessRequest& request) = 0;
};

using OraclePtr = std::shared_ptr<RandomnessOracle>;

} // namespace rf
