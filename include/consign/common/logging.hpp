#pragma once

#include <consign/config/config.hpp>

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace consign::common {

inline constexpr std::string_view kLoggerName{"consign"};

/// Install the `consign` logger as spdlog's default logger.
///
/// Logs to a colour console sink and, when `config.file` is set, to a basic
/// file sink. With `config.async` the logger runs on spdlog's thread pool and
/// blocks when the queue is full so no record is dropped.
std::shared_ptr<spdlog::logger> configure_logging(
    const consign::config::logging_config& config);

}  // namespace consign::common
