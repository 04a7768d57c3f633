#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace consign::common {

/// Log and terminate on a broken internal invariant.
///
/// Reserved for conditions no request can cause (e.g. an in-memory record
/// that fails to encode). Anything a submitter or the state store can trigger
/// is reported as a rejection or a thrown error instead.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace consign::common
