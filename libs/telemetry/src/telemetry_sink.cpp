#include "walletcore/telemetry/telemetry_sink.hpp"

#include <utility>

namespace walletcore {
namespace telemetry {

std::string_view to_string(Level level) noexcept {
  switch (level) {
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
  }
  return "INFO";
}

bool parse_level(std::string_view text, Level& out) noexcept {
  if (text == "info") {
    out = Level::kInfo;
  } else if (text == "warn") {
    out = Level::kWarn;
  } else if (text == "error") {
    out = Level::kError;
  } else {
    return false;
  }
  return true;
}

// EventSink helpers

void EventSink::info(std::string message) {
  publish(Event{.level = Level::kInfo, .message = std::move(message)});
}

void EventSink::warn(std::string message) {
  publish(Event{.level = Level::kWarn, .message = std::move(message)});
}

void EventSink::error(std::string message) {
  publish(Event{.level = Level::kError, .message = std::move(message)});
}

void EventSink::section_header(std::string_view title) {
  std::string line = "========== ";
  line.append(title);
  line.append(" ==========");
  info(std::move(line));
}

// TelemetrySink implementation

void TelemetrySink::publish(const Event& event) {
  ++counts_[static_cast<std::size_t>(event.level)];
  buffer_.push_back(event);
}

std::uint64_t TelemetrySink::count(Level level) const noexcept {
  return counts_[static_cast<std::size_t>(level)];
}

std::vector<Event> TelemetrySink::drain() {
  auto copy = std::move(buffer_);
  buffer_.clear();
  return copy;
}

}  // namespace telemetry
}  // namespace walletcore
