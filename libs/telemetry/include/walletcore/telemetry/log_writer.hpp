#pragma once

#include <cstdio>
#include <filesystem>
#include <string>
#include <system_error>

#include "walletcore/telemetry/telemetry_sink.hpp"

namespace walletcore {
namespace telemetry {

struct LogWriterOptions {
  std::filesystem::path path{};
  std::string component{"Terminal"};
  Level min_level{Level::kInfo};
};

// Appends one formatted line per event to a log file:
//   2024-01-31 12:00:00 [INFO] [Terminal] message
// Opening failures throw; write failures never do. They stop the writer and
// are reported through ok() / last_error().
class LogWriter final : public EventSink {
 public:
  explicit LogWriter(LogWriterOptions options);
  LogWriter(const LogWriter&) = delete;
  LogWriter& operator=(const LogWriter&) = delete;
  LogWriter(LogWriter&&) = delete;
  LogWriter& operator=(LogWriter&&) = delete;
  ~LogWriter() override;

  void publish(const Event& event) override;
  void flush();

  [[nodiscard]] const std::filesystem::path& path() const noexcept { return options_.path; }
  [[nodiscard]] bool ok() const noexcept { return !error_; }
  [[nodiscard]] const std::error_code& last_error() const noexcept { return error_; }

  // <directory>/<prefix>_<YYYYmmdd_HHMMSS>.log
  [[nodiscard]] static std::filesystem::path session_path(const std::filesystem::path& directory,
                                                          std::string_view prefix);

 private:
  LogWriterOptions options_;
  std::FILE* file_{nullptr};
  std::error_code error_{};

  void ensure_open();
  void fail(int err);
};

}  // namespace telemetry
}  // namespace walletcore
