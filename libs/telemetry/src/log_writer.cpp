#include "walletcore/telemetry/log_writer.hpp"

#include <cerrno>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "walletcore/common/time_utils.hpp"

namespace walletcore {
namespace telemetry {

LogWriter::LogWriter(LogWriterOptions options)
    : options_(std::move(options)) {
  ensure_open();
}

LogWriter::~LogWriter() {
  if (file_) {
    std::fflush(file_);
    std::fclose(file_);
    file_ = nullptr;
  }
}

std::filesystem::path LogWriter::session_path(const std::filesystem::path& directory,
                                              std::string_view prefix) {
  std::string name{prefix};
  name += '_';
  name += common::format_local_now("%Y%m%d_%H%M%S");
  name += ".log";
  return directory / name;
}

void LogWriter::ensure_open() {
  const auto parent = options_.path.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw std::runtime_error("failed to create log directory " + parent.string() + ": " + ec.message());
    }
  }

  file_ = std::fopen(options_.path.c_str(), "ab");
  if (!file_) {
    throw std::runtime_error("failed to open log file: " + options_.path.string());
  }
}

void LogWriter::publish(const Event& event) {
  if (!file_ || event.level < options_.min_level) {
    return;
  }

  std::string line = common::format_local_now("%Y-%m-%d %H:%M:%S");
  line += " [";
  line.append(to_string(event.level));
  line += "] [";
  line += options_.component;
  line += "] ";
  line += event.message;
  line += '\n';

  const auto wrote = std::fwrite(line.data(), 1, line.size(), file_);
  if (wrote != line.size()) {
    fail(errno);
    return;
  }
  flush();
}

void LogWriter::flush() {
  if (file_ && std::fflush(file_) != 0) {
    fail(errno);
  }
}

// The first write error closes the file; later events are dropped.
void LogWriter::fail(int err) {
  error_ = std::error_code(err != 0 ? err : EIO, std::system_category());
  std::fclose(file_);
  file_ = nullptr;
}

}  // namespace telemetry
}  // namespace walletcore
