#include "walletcore/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <sstream>

namespace walletcore {
namespace config {

namespace {

std::string get_str_or(const toml::table& tbl, std::string_view key, std::string_view default_val) {
  if (auto val = tbl[key].value<std::string_view>()) {
    return std::string(*val);
  }
  return std::string(default_val);
}

SessionConfig parse_session(const toml::table& root) {
  SessionConfig cfg;
  if (auto* session = root["session"].as_table()) {
    cfg.product_name = get_str_or(*session, "product_name", cfg.product_name);
  }
  return cfg;
}

LoggingConfig parse_logging(const toml::table& root) {
  LoggingConfig cfg;
  if (auto* logging = root["logging"].as_table()) {
    if (auto val = (*logging)["enabled"].value<bool>()) {
      cfg.enabled = *val;
    }
    cfg.directory = get_str_or(*logging, "directory", cfg.directory.string());
    cfg.file_prefix = get_str_or(*logging, "file_prefix", cfg.file_prefix);
    cfg.component = get_str_or(*logging, "component", cfg.component);
    cfg.level = get_str_or(*logging, "level", cfg.level);
  }
  return cfg;
}

TerminalConfig parse_config(const toml::table& root) {
  TerminalConfig cfg;
  cfg.session = parse_session(root);
  cfg.logging = parse_logging(root);
  return cfg;
}

}  // namespace

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  LoadResult result;

  if (!std::filesystem::exists(path)) {
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }

  auto parse_result = toml::parse_file(path.string());
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parse_result.table());
  result.errors = validate(result.config);
  result.success = result.errors.empty();
  return result;
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  LoadResult result;

  auto parse_result = toml::parse(toml_content);
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parse_result.table());
  result.errors = validate(result.config);
  result.success = result.errors.empty();
  return result;
}

std::vector<ValidationError> ConfigLoader::validate(const TerminalConfig& config) {
  std::vector<ValidationError> errors;

  if (config.session.product_name.empty()) {
    errors.push_back({"session.product_name", "product_name cannot be empty"});
  }

  telemetry::Level level{};
  if (!telemetry::parse_level(config.logging.level, level)) {
    errors.push_back({"logging.level", "must be one of info, warn, error"});
  }

  if (!config.logging.enabled) {
    return errors;
  }

  if (config.logging.directory.empty()) {
    errors.push_back({"logging.directory", "directory cannot be empty"});
  }

  if (config.logging.file_prefix.empty()) {
    errors.push_back({"logging.file_prefix", "file_prefix cannot be empty"});
  }

  if (config.logging.component.empty()) {
    errors.push_back({"logging.component", "component cannot be empty"});
  }

  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# Wallet Terminal Configuration
# Generated default configuration

[session]
product_name = "Ryz Labs Wallet Terminal"

[logging]
enabled = true
directory = "logs/src"
file_prefix = "terminal"   # terminal_<YYYYmmdd_HHMMSS>.log
component = "Terminal"
level = "info"             # info | warn | error
)";
}

telemetry::Level min_level(const LoggingConfig& logging) noexcept {
  telemetry::Level level = telemetry::Level::kInfo;
  if (!telemetry::parse_level(logging.level, level)) {
    return telemetry::Level::kInfo;
  }
  return level;
}

}  // namespace config
}  // namespace walletcore
