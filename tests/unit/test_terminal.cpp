#include "test_terminal.hpp"

#include <cassert>
#include <cstdint>
#include <limits>
#include <sstream>
#include <string>
#include <utility>

#include "walletcore/ledger/balance.hpp"
#include "walletcore/telemetry/telemetry_sink.hpp"
#include "walletcore/terminal/wallet_terminal.hpp"

namespace walletcore::tests {

namespace {

struct Session {
  std::istringstream in;
  std::ostringstream out;
  telemetry::TelemetrySink events;
  terminal::WalletTerminal shell;

  explicit Session(std::string script)
      : in(std::move(script)), shell(in, out, events, "Test Wallet") {}

  bool saw(const std::string& text) const { return out.str().find(text) != std::string::npos; }
};

}  // namespace

void test_parse_amount() {
  assert(terminal::parse_amount("100") == 100);
  assert(terminal::parse_amount("  42\r\n") == 42);
  assert(terminal::parse_amount("-7") == -7);
  assert(terminal::parse_amount("+15") == 15);
  assert(!terminal::parse_amount("").has_value());
  assert(!terminal::parse_amount("abc").has_value());
  assert(!terminal::parse_amount("12abc").has_value());
  assert(!terminal::parse_amount("1.5").has_value());
  assert(!terminal::parse_amount("+-3").has_value());
  assert(!terminal::parse_amount("99999999999999999999").has_value());
  assert(terminal::parse_amount("9223372036854775807") == INT64_MAX);
  assert(terminal::parse_amount("-9223372036854775808") == INT64_MIN);
  assert(!terminal::parse_amount("9223372036854775808").has_value());
}

void test_terminal_deposit_and_balance() {
  Session session("2\nwallet_1\n100\n2\nwallet_1\n50\n1\nwallet_1\n1\nwallet_2\n5\n");
  session.shell.run();

  assert(session.saw("Welcome to Test Wallet!"));
  assert(session.saw("Successfully deposited 100 to the wallet"));
  assert(session.saw("Successfully deposited 50 to the wallet"));
  assert(session.saw("Balance for wallet wallet_1: 150"));
  assert(session.saw("Balance for wallet wallet_2: 0"));
  assert(session.saw("Thank you for using Test Wallet!"));
  assert(session.shell.ledger().size() == 2);
}

void test_terminal_rejects_non_positive_amounts() {
  Session session("2\nw\n0\n2\nw\n-5\n3\nw\nlots\n5\n");
  session.shell.run();

  assert(session.saw("Amount must be positive"));
  assert(session.saw("Invalid amount. Please enter a valid number."));
  assert(session.shell.ledger().empty());
  assert(session.events.count(telemetry::Level::kError) == 4);
}

void test_terminal_deposit_balance_ceiling() {
  Session session(
      "2\nw\n9223372036854775807\n"
      "2\nw\n9223372036854775807\n"
      "2\nw\n1\n"
      "1\nw\n"
      "3\nw\n7\n"
      "4\nw\n"
      "5\n");
  session.shell.run();

  constexpr auto kMax = std::numeric_limits<common::Balance>::max();
  const auto txs = session.shell.ledger().transactions();
  assert(txs.size() == 2);
  assert(txs[0].kind == common::TransactionKind::kDeposit && txs[0].amount == kMax);
  assert(txs[1].kind == common::TransactionKind::kWithdrawal && txs[1].amount == 7);

  assert(session.saw("Deposit rejected. Balance cannot exceed 9223372036854775807 "
                     "(current balance: 9223372036854775807)"));
  assert(session.saw("Balance for wallet w: 9223372036854775807"));
  assert(session.saw("Successfully withdrew 7 from the wallet"));
  assert(session.saw("Withdrawal of 7 to w | Running balance: 9223372036854775800\n"));

  const auto result = ledger::compute_balance(txs, "w");
  assert(result.ok() && result.balance == kMax - 7);
}

void test_terminal_withdrawal_guard() {
  Session session("2\nw\n50\n3\nw\n80\n3\nw\n20\n1\nw\n5\n");
  session.shell.run();

  assert(session.saw("Insufficient funds. Available balance: 50"));
  assert(session.saw("Successfully withdrew 20 from the wallet"));
  assert(session.saw("Balance for wallet w: 30"));

  const auto txs = session.shell.ledger().transactions();
  assert(txs.size() == 2);
  assert(txs[1].kind == common::TransactionKind::kWithdrawal);
  assert(txs[1].amount == 20);

  const auto result = ledger::compute_balance(txs, "w");
  assert(result.ok() && result.balance == 30);
}

void test_terminal_history_output() {
  Session session("2\nhistory_wallet\n100\n2\nother\n7\n3\nhistory_wallet\n30\n2\nhistory_wallet\n50\n4\nhistory_wallet\n5\n");
  session.shell.run();

  const std::string expected =
      "Transaction history for wallet history_wallet:\n"
      "Deposit of 100 to history_wallet | Running balance: 100\n"
      "Withdrawal of 30 to history_wallet | Running balance: 70\n"
      "Deposit of 50 to history_wallet | Running balance: 120\n";
  assert(session.saw(expected));
}

void test_terminal_invalid_choice_and_eof() {
  Session session("9\n\n1\n");
  session.shell.run();

  assert(session.saw("Invalid choice. Please try again."));
  assert(session.saw("Thank you for using Test Wallet!"));

  bool logged_invalid = false;
  for (const auto& event : session.events.events()) {
    if (event.message == "Invalid menu choice entered: 9") {
      logged_invalid = event.level == telemetry::Level::kError;
    }
  }
  assert(logged_invalid);
}

}  // namespace walletcore::tests
