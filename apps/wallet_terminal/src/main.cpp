#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "walletcore/config/config_loader.hpp"
#include "walletcore/telemetry/log_writer.hpp"
#include "walletcore/telemetry/telemetry_sink.hpp"
#include "walletcore/terminal/wallet_terminal.hpp"

namespace {

constexpr std::string_view kConfigFileName = "wallet_terminal.toml";

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " [config_file]\n"
            << "\n"
            << "Interactive wallet ledger. Transactions live in memory for this session only.\n"
            << "\n"
            << "  config_file  TOML file with [session] and [logging] tables.\n"
            << "               Without it the first existing " << kConfigFileName << " is used from:\n"
            << "                 the current directory, /etc/walletcore, $HOME/.config/walletcore\n"
            << "               If none exists, built-in defaults apply and the session log is\n"
            << "               written to logs/src/terminal_<YYYYmmdd_HHMMSS>.log.\n";
}

// Explicit argument first, then the search directories; empty when nothing is found.
std::filesystem::path find_config_path(int argc, char* argv[]) {
  namespace fs = std::filesystem;
  if (argc > 1) {
    return fs::path{argv[1]};
  }

  std::vector<fs::path> search_dirs{".", "/etc/walletcore"};
  if (const char* home = std::getenv("HOME"); home && *home) {
    search_dirs.push_back(fs::path{home} / ".config" / "walletcore");
  }

  std::error_code ec;
  for (const auto& dir : search_dirs) {
    auto candidate = dir / kConfigFileName;
    if (fs::is_regular_file(candidate, ec)) {
      return candidate;
    }
  }
  return {};
}

// Null when logging is off or the file cannot be opened; events are then discarded.
std::unique_ptr<walletcore::telemetry::LogWriter> open_session_log(
    const walletcore::config::LoggingConfig& logging) {
  using namespace walletcore;

  if (!logging.enabled) {
    return nullptr;
  }

  try {
    return std::make_unique<telemetry::LogWriter>(telemetry::LogWriterOptions{
        .path = telemetry::LogWriter::session_path(logging.directory, logging.file_prefix),
        .component = logging.component,
        .min_level = config::min_level(logging),
    });
  } catch (const std::exception& e) {
    std::cerr << "Warning: Failed to initialize logging: " << e.what() << "\n";
    return nullptr;
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace walletcore;

  if (argc > 1) {
    const std::string_view arg{argv[1]};
    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    }
  }

  auto config_path = find_config_path(argc, argv);
  config::TerminalConfig cfg;

  if (config_path.empty()) {
    auto result = config::ConfigLoader::load_from_string(config::ConfigLoader::generate_default());
    if (!result.success) {
      std::cerr << "Failed to load default config: " << result.raw_error << "\n";
      return 1;
    }
    cfg = std::move(result.config);
  } else {
    auto result = config::ConfigLoader::load(config_path);
    if (!result.success) {
      if (!result.raw_error.empty()) {
        std::cerr << "Parse error: " << result.raw_error << "\n";
      }
      for (const auto& err : result.errors) {
        std::cerr << "Validation error [" << err.field << "]: " << err.message << "\n";
      }
      return 1;
    }
    cfg = std::move(result.config);
  }

  auto session_log = open_session_log(cfg.logging);
  telemetry::DiscardSink discard;
  telemetry::EventSink& events = session_log ? static_cast<telemetry::EventSink&>(*session_log) : discard;
  if (!config_path.empty()) {
    events.info("Loaded config from " + config_path.string());
  }

  terminal::WalletTerminal wallet_terminal{std::cin, std::cout, events, cfg.session.product_name};
  try {
    wallet_terminal.run();
  } catch (const std::exception& e) {
    std::cerr << "Session aborted: " << e.what() << "\n";
    return 1;
  }

  if (session_log && !session_log->ok()) {
    std::cerr << "Warning: session log " << session_log->path() << " is incomplete: "
              << session_log->last_error().message() << "\n";
  }
  return 0;
}
