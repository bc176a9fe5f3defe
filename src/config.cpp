#include "config.hpp"

#include <cstdlib>
#include <limits>
#include <optional>
#include <stdexcept>

namespace rf {

namespace {

// Upper bound the local oracle accepts for a fulfillment callback.
constexpr std::uint32_t kMaxCallbackGasLimit = 2'500'000;

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

std::optional<std::string> readEnv(const char* name) {
    const char* env = std::getenv(name);
    if (env == nullptr) {
        return std::nullopt;
    }
    std::string value = trim(env);
    if (value.empty()) {
        throw std::invalid_argument(std::string(name) + " is set but empty");
    }
    return value;
}

std::uint64_t parseUnsigned(const char* name, const std::string& value) {
    if (value.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument(std::string(name) + " must be an unsigned integer, got \"" +
                                    value + "\"");
    }
    try {
        return std::stoull(value);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(std::string(name) + " is out of range: \"" + value + "\"");
    }
}

} // namespace

RaffleConfig loadConfigFromEnvironment() {
    RaffleConfig cfg;

    if (auto fee = readEnv("RAFFLE_ENTRANCE_FEE")) {
        try {
            cfg.entranceFee = Amount::parse(*fee);
        } catch (const std::exception& ex) {
            throw std::invalid_argument(std::string("RAFFLE_ENTRANCE_FEE: ") + ex.what());
        }
    }
    if (auto interval = readEnv("RAFFLE_INTERVAL_SECONDS")) {
        std::uint64_t seconds = parseUnsigned("RAFFLE_INTERVAL_SECONDS", *interval);
        if (seconds > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            throw std::invalid_argument("RAFFLE_INTERVAL_SECONDS is out of range");
        }
        cfg.interval = std::chrono::seconds(static_cast<std::int64_t>(seconds));
    }
    if (auto keyHash = readEnv("RAFFLE_KEY_HASH")) {
        cfg.oracle.keyHash = *keyHash;
    }
    if (auto subscription = readEnv("RAFFLE_SUBSCRIPTION_ID")) {
        cfg.oracle.subscriptionId = parseUnsigned("RAFFLE_SUBSCRIPTION_ID", *subscription);
    }
    if (auto gasLimit = readEnv("RAFFLE_CALLBACK_GAS_LIMIT")) {
        std::uint64_t limit = parseUnsigned("RAFFLE_CALLBACK_GAS_LIMIT", *gasLimit);
        if (limit > std::numeric_limits<std::uint32_t>::max()) {
            throw std::invalid_argument("RAFFLE_CALLBACK_GAS_LIMIT is out of range");
        }
        cfg.oracle.callbackGasLimit = static_cast<std::uint32_t>(limit);
    }

    validateConfig(cfg);
    return cfg;
}

void validateConfig(const RaffleConfig& cfg) {
    if (cfg.interval.count() < 0) {
        throw std::invalid_argument("Draw interval must not be negative");
    }
    if (cfg.oracle.keyHash.empty()) {
        throw std::invalid_argument("Oracle key hash (gas lane) must not be empty");
    }
    if (cfg.oracle.callbackGasLimit == 0) {
        throw std::invalid_argument("Callback gas limit must be positive");
    }
    if (cfg.oracle.callbackGasLimit > kMaxCallbackGasLimit) {
        throw std::invalid_argument("Callback gas limit exceeds the oracle maximum of 2500000");
    }
}

} // namespace rf
