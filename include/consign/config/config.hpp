#pragma once

#include <istream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace consign::config {

/// Raised when a configuration source cannot be read or holds an invalid
/// value.
class config_error final : public std::runtime_error {
 public:
  explicit config_error(const std::string& message)
      : std::runtime_error{message} {}
};

/// Transaction family identity. `name` seeds the address namespace.
struct family_config final {
  std::string name{"transfer-chain"};
  std::string version{"0.0"};
  std::string content_type{"application/scale"};
};

struct logging_config final {
  std::string level{"info"};
  std::string pattern{"%H:%M:%S.%e [%^%l%$] [%n] %v"};
  std::optional<std::string> file{std::nullopt};
  bool async{true};
};

struct app_config final {
  family_config family;
  logging_config logging;
};

/// Parse an INI style configuration (`[family]`, `[logging]` sections).
/// Missing keys keep their defaults.
app_config load_config(std::istream& input);

/// Parse the configuration file at `path`.
app_config load_config(std::string_view path);

}  // namespace consign::config
