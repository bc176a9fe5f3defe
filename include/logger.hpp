#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace rf::log {

using Logger = std::shared_ptr<spdlog::logger>;

/**
 * Provide a logger for a component.
 * @param tag - name identifying the component in log lines
 * @return shared logger, created on first use
 */
Logger createLogger(const std::string& tag);

} // namespace rf::log
