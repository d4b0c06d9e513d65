#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "walletcore/telemetry/telemetry_sink.hpp"

namespace walletcore {
namespace config {

struct SessionConfig {
  std::string product_name{"Ryz Labs Wallet Terminal"};
};

struct LoggingConfig {
  bool enabled{true};
  std::filesystem::path directory{"logs/src"};
  std::string file_prefix{"terminal"};
  std::string component{"Terminal"};
  std::string level{"info"};
};

struct TerminalConfig {
  SessionConfig session;
  LoggingConfig logging;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  TerminalConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const TerminalConfig& config);
  static std::string generate_default();
};

// Level named by logging.level; info when the name is not recognised.
[[nodiscard]] telemetry::Level min_level(const LoggingConfig& logging) noexcept;

}  // namespace config
}  // namespace walletcore
