#pragma once

#include "amount.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace rf {

struct OracleConfig {
    static constexpr std::uint16_t kRequestConfirmations = 3;
    static constexpr std::uint32_t kNumWords = 1;

    std::string keyHash = "local-gas-lane";
    std::uint64_t subscriptionId = 1;
    std::uint32_t callbackGasLimit = 500'000;
};

struct RaffleConfig {
    Amount entranceFee = Amount::fromMicros(10'000); // 0.01 units
    std::chrono::seconds interval{ 30 };
    OracleConfig oracle;
};

// Reads RAFFLE_ENTRANCE_FEE, RAFFLE_INTERVAL_SECONDS, RAFFLE_KEY_HASH,
// RAFFLE_SUBSCRIPTION_ID and RAFFLE_CALLBACK_GAS_LIMIT over the defaults.
RaffleConfig loadConfigFromEnvironment();

// Throws std::invalid_argument describing the first violated constraint.
void validateConfig(const RaffleConfig& cfg);

} // namespace rf
