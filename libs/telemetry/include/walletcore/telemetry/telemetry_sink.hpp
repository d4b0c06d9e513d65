#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace walletcore {
namespace telemetry {

enum class Level : std::uint8_t {
  kInfo,
  kWarn,
  kError,
};

inline constexpr std::size_t kLevelCount = 3;

[[nodiscard]] std::string_view to_string(Level level) noexcept;
[[nodiscard]] bool parse_level(std::string_view text, Level& out) noexcept;

struct Event {
  Level level{Level::kInfo};
  std::string message{};
};

// Destination for session events. Writers format and persist; the ledger only publishes.
class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual void publish(const Event& event) = 0;

  void info(std::string message);
  void warn(std::string message);
  void error(std::string message);
  void section_header(std::string_view title);
};

class DiscardSink final : public EventSink {
 public:
  void publish(const Event&) override {}
};

// In-memory sink that keeps every event until drained.
class TelemetrySink final : public EventSink {
 public:
  void publish(const Event& event) override;

  [[nodiscard]] std::uint64_t count(Level level) const noexcept;
  [[nodiscard]] const std::vector<Event>& events() const noexcept { return buffer_; }
  [[nodiscard]] std::vector<Event> drain();

 private:
  std::vector<Event> buffer_{};
  std::array<std::uint64_t, kLevelCount> counts_{};
};

}  // namespace telemetry
}  // namespace walletcore
