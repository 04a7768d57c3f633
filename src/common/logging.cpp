#include <consign/common/logging.hpp>

#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <string>
#include <vector>

namespace consign::common {

std::shared_ptr<spdlog::logger> configure_logging(
    const consign::config::logging_config& config) {
  auto sinks = std::vector<spdlog::sink_ptr>{};
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (config.file) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(*config.file, false));
  }

  spdlog::drop(std::string{kLoggerName});
  auto logger = std::shared_ptr<spdlog::logger>{};
  if (config.async) {
    if (!spdlog::thread_pool()) {
      spdlog::init_thread_pool(8192, 1);
    }
    logger = std::make_shared<spdlog::async_logger>(
        std::string{kLoggerName}, std::begin(sinks), std::end(sinks),
        spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  } else {
    logger = std::make_shared<spdlog::logger>(
        std::string{kLoggerName}, std::begin(sinks), std::end(sinks));
  }

  logger->set_pattern(config.pattern);
  logger->set_level(spdlog::level::from_str(config.level));
  spdlog::set_default_logger(logger);
  spdlog::debug("Logging configured at level {}", config.level);
  return logger;
}

}  // namespace consign::common
