#include "logger.hpp"

#include <cstdlib>
#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace rf::log {

namespace {

spdlog::level::level_enum levelFromEnvironment() {
    const char* env = std::getenv("RAFFLE_LOG_LEVEL");
    if (env == nullptr) {
        return spdlog::level::info;
    }
    // Unknown names map to "off" in spdlog; keep info instead.
    auto level = spdlog::level::from_str(env);
    if (level == spdlog::level::off && std::string(env) != "off") {
        return spdlog::level::info;
    }
    return level;
}

} // namespace

Logger createLogger(const std::string& tag) {
    static std::mutex creationMutex;
    std::lock_guard<std::mutex> lock(creationMutex);

    if (auto existing = spdlog::get(tag)) {
        return existing;
    }
    auto logger = spdlog::stderr_color_mt(tag);
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%n] %^%l%$ %v");
    logger->set_level(levelFromEnvironment());
    return logger;
}

} // namespace rf::log
