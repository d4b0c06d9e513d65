#include "test_telemetry.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#include "walletcore/telemetry/log_writer.hpp"
#include "walletcore/telemetry/telemetry_sink.hpp"

namespace walletcore::tests {

void test_telemetry_sink() {
  telemetry::TelemetrySink sink;
  sink.info("first");
  sink.error("second");
  sink.section_header("Start Test: Telemetry");

  assert(sink.count(telemetry::Level::kInfo) == 2);
  assert(sink.count(telemetry::Level::kError) == 1);
  assert(sink.count(telemetry::Level::kWarn) == 0);

  auto events = sink.drain();
  assert(events.size() == 3);
  assert(events[1].level == telemetry::Level::kError);
  assert(events[2].message == "========== Start Test: Telemetry ==========");
  assert(sink.events().empty());

  telemetry::Level level{};
  assert(telemetry::parse_level("warn", level) && level == telemetry::Level::kWarn);
  assert(!telemetry::parse_level("verbose", level));
  assert(telemetry::to_string(telemetry::Level::kError) == "ERROR");
}

void test_log_writer() {
  namespace fs = std::filesystem;
  const auto tmp_root = fs::temp_directory_path() / "walletcore_tests" / "logs";
  fs::remove_all(tmp_root);

  const auto path = telemetry::LogWriter::session_path(tmp_root, "terminal");
  assert(path.parent_path() == tmp_root);
  assert(path.filename().string().rfind("terminal_", 0) == 0);
  assert(path.extension() == ".log");

  {
    telemetry::LogWriter writer(telemetry::LogWriterOptions{.path = path, .component = "Terminal", .min_level = telemetry::Level::kInfo});
    writer.info("Starting wallet terminal session");
    writer.error("Invalid menu choice entered: 9");
  }
  {
    telemetry::LogWriter errors_only(telemetry::LogWriterOptions{.path = path, .component = "Terminal", .min_level = telemetry::Level::kError});
    errors_only.info("dropped");
    errors_only.error("kept");
  }

  std::ifstream in(path);
  std::vector<std::string> lines;
  for (std::string line; std::getline(in, line);) {
    lines.push_back(line);
  }

  assert(lines.size() == 3);
  assert(lines[0].find(" [INFO] [Terminal] Starting wallet terminal session") != std::string::npos);
  assert(lines[1].find(" [ERROR] [Terminal] Invalid menu choice entered: 9") != std::string::npos);
  assert(lines[2].find("[ERROR] [Terminal] kept") != std::string::npos);
  // "YYYY-mm-dd HH:MM:SS " prefix
  assert(lines[0].size() > 20 && lines[0][4] == '-' && lines[0][10] == ' ' && lines[0][13] == ':');

  fs::remove_all(tmp_root.parent_path());
}

void test_log_writer_reports_full_device() {
  namespace fs = std::filesystem;
  const fs::path full_device{"/dev/full"};
  if (!fs::exists(full_device)) {
    return;
  }

  telemetry::LogWriter writer(telemetry::LogWriterOptions{.path = full_device});
  assert(writer.ok());
  writer.info("Starting wallet terminal session");
  assert(!writer.ok());
  assert(writer.last_error() == std::errc::no_space_on_device);

  // Later events are dropped without raising.
  writer.error("Invalid menu choice entered: 9");
  writer.flush();
  assert(!writer.ok());
}

}  // namespace walletcore::tests
