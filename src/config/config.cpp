#include <consign/config/config.hpp>

#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>

#include <fstream>

namespace consign::config {

namespace {

namespace po = boost::program_options;

po::options_description make_description(app_config& config) {
  auto description = po::options_description{"consign"};
  description.add_options()(
      "family.name",
      po::value<std::string>(&config.family.name)
          ->default_value(config.family.name),
      "Transaction family name; seeds the address namespace")(
      "family.version",
      po::value<std::string>(&config.family.version)
          ->default_value(config.family.version),
      "Transaction family version")(
      "family.content_type",
      po::value<std::string>(&config.family.content_type)
          ->default_value(config.family.content_type),
      "Accepted payload content type")(
      "logging.level",
      po::value<std::string>(&config.logging.level)
          ->default_value(config.logging.level),
      "trace, debug, info, warn, error, critical or off")(
      "logging.pattern",
      po::value<std::string>(&config.logging.pattern)
          ->default_value(config.logging.pattern),
      "spdlog pattern")("logging.file", po::value<std::string>(),
                        "Optional log file path")(
      "logging.async",
      po::value<bool>(&config.logging.async)
          ->default_value(config.logging.async),
      "Log through the spdlog thread pool");
  return description;
}

void validate(const app_config& config) {
  if (config.family.name.empty()) {
    throw config_error{"family.name must not be empty"};
  }
  if (config.family.version.empty()) {
    throw config_error{"family.version must not be empty"};
  }
  // spdlog maps unknown names to `off`, so only accept it when asked for.
  auto level = spdlog::level::from_str(config.logging.level);
  if (level == spdlog::level::off && config.logging.level != "off") {
    throw config_error{"unknown logging.level '" + config.logging.level + "'"};
  }
}

}  // namespace

app_config load_config(std::istream& input) {
  auto config = app_config{};
  auto description = make_description(config);
  auto vm = po::variables_map{};
  try {
    po::store(po::parse_config_file(input, description), vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    throw config_error{ex.what()};
  }

  if (vm.contains("logging.file")) {
    config.logging.file = vm["logging.file"].as<std::string>();
  }
  validate(config);
  return config;
}

app_config load_config(std::string_view path) {
  auto input = std::ifstream{std::string{path}};
  if (!input) {
    throw config_error{"cannot open configuration file '" + std::string{path} +
                       "'"};
  }
  spdlog::debug("Loading configuration from '{}'", path);
  return load_config(input);
}

}  // namespace consign::config
