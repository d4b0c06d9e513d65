#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

#include "walletcore/common/types.hpp"
#include "walletcore/ledger/ledger_state.hpp"
#include "walletcore/telemetry/telemetry_sink.hpp"

namespace walletcore {
namespace terminal {

// Trimmed text parsed as a signed 64-bit integer with an optional sign.
// The session treats std::nullopt as an amount of 0.
[[nodiscard]] std::optional<common::Amount> parse_amount(std::string_view text) noexcept;

// Menu-driven session over a line-oriented input stream. Owns the session's
// ledger; every query borrows it read-only.
class WalletTerminal {
 public:
  WalletTerminal(std::istream& in, std::ostream& out, telemetry::EventSink& events,
                 std::string product_name = "Ryz Labs Wallet Terminal");

  // Runs until the user picks Exit or the input ends.
  void run();

  // One menu round. Returns true when the session should end.
  bool show_menu();

  [[nodiscard]] const ledger::LedgerState& ledger() const noexcept { return ledger_; }

 private:
  std::istream& in_;
  std::ostream& out_;
  telemetry::EventSink& events_;
  std::string product_name_;
  ledger::LedgerState ledger_{};

  std::optional<std::string> read_line();
  std::optional<std::string> prompt_wallet_id();
  std::optional<common::Amount> prompt_amount();

  void check_balance();
  void deposit();
  void withdraw();
  void view_history();
};

}  // namespace terminal
}  // namespace walletcore
