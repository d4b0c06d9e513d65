#include "walletcore/terminal/wallet_terminal.hpp"

#include <charconv>
#include <istream>
#include <limits>
#include <ostream>
#include <utility>

#include "walletcore/common/text.hpp"
#include "walletcore/ledger/balance.hpp"
#include "walletcore/ledger/history.hpp"

namespace walletcore {
namespace terminal {

std::optional<common::Amount> parse_amount(std::string_view text) noexcept {
  auto digits = common::trim(text);
  if (digits.size() > 1 && digits.front() == '+' && digits[1] != '-') {
    digits.remove_prefix(1);
  }
  if (digits.empty()) {
    return std::nullopt;
  }

  common::Amount value = 0;
  const auto* first = digits.data();
  const auto* last = digits.data() + digits.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return value;
}

WalletTerminal::WalletTerminal(std::istream& in, std::ostream& out, telemetry::EventSink& events,
                               std::string product_name)
    : in_(in), out_(out), events_(events), product_name_(std::move(product_name)) {
  events_.info("Initializing new WalletTerminal instance");
}

void WalletTerminal::run() {
  events_.info("Starting wallet terminal session");
  out_ << "Welcome to " << product_name_ << "!\n";

  while (!show_menu()) {
  }

  events_.info("Terminating wallet terminal session");
  out_ << "Thank you for using " << product_name_ << "!\n";
}

bool WalletTerminal::show_menu() {
  out_ << "\nPlease select an option:\n"
       << "1. Check Balance\n"
       << "2. Deposit\n"
       << "3. Withdraw\n"
       << "4. View Transaction History\n"
       << "5. Exit\n"
       << "\nEnter your choice (1-5): " << std::flush;

  auto line = read_line();
  if (!line) {
    events_.info("Input closed, treating as Exit");
    out_ << '\n';
    return true;
  }

  const auto choice = common::trim(*line);
  if (choice == "1") {
    events_.info("Selected: Check Balance");
    check_balance();
  } else if (choice == "2") {
    events_.info("Selected: Deposit");
    deposit();
  } else if (choice == "3") {
    events_.info("Selected: Withdraw");
    withdraw();
  } else if (choice == "4") {
    events_.info("Selected: View History");
    view_history();
  } else if (choice == "5") {
    events_.info("Selected: Exit");
    return true;
  } else {
    events_.error("Invalid menu choice entered: " + std::string(choice));
    out_ << "Invalid choice. Please try again.\n";
  }

  return false;
}

std::optional<std::string> WalletTerminal::read_line() {
  std::string line;
  if (!std::getline(in_, line)) {
    return std::nullopt;
  }
  return line;
}

std::optional<std::string> WalletTerminal::prompt_wallet_id() {
  out_ << "Enter wallet address: " << std::flush;
  auto line = read_line();
  if (!line) {
    return std::nullopt;
  }
  std::string wallet_id{common::trim(*line)};
  events_.info("Wallet address entered: " + wallet_id);
  return wallet_id;
}

std::optional<common::Amount> WalletTerminal::prompt_amount() {
  out_ << "Enter amount: " << std::flush;
  auto line = read_line();
  if (!line) {
    return std::nullopt;
  }

  if (auto amount = parse_amount(*line)) {
    events_.info("Amount entered: " + std::to_string(*amount));
    return amount;
  }

  events_.error("Invalid amount entered: " + std::string(common::trim(*line)));
  out_ << "Invalid amount. Please enter a valid number.\n";
  return common::Amount{0};
}

void WalletTerminal::check_balance() {
  const auto wallet_id = prompt_wallet_id();
  if (!wallet_id) {
    return;
  }

  const auto result = ledger::compute_balance(ledger_.transactions(), *wallet_id, events_);
  if (result.ok()) {
    events_.info("Balance check successful for " + *wallet_id + ": " + std::to_string(result.balance));
    out_ << "Balance for wallet " << *wallet_id << ": " << result.balance << '\n';
  } else {
    const auto message = result.error->message();
    events_.error("Balance check failed for " + *wallet_id + ": " + message);
    out_ << "Error checking balance: " << message << '\n';
  }
}

void WalletTerminal::deposit() {
  const auto wallet_id = prompt_wallet_id();
  if (!wallet_id) {
    return;
  }
  const auto amount = prompt_amount();
  if (!amount) {
    return;
  }

  if (*amount <= 0) {
    events_.error("Invalid deposit amount attempted: " + std::to_string(*amount));
    out_ << "Amount must be positive\n";
    return;
  }

  // Every appended sequence must fold without leaving the Amount range.
  const auto current = ledger::compute_balance(ledger_.transactions(), *wallet_id);
  if (!current.ok()) {
    const auto message = current.error->message();
    events_.error("Deposit error for wallet " + *wallet_id + ": " + message);
    out_ << "Error: " << message << '\n';
    return;
  }

  constexpr auto kMaxBalance = std::numeric_limits<common::Balance>::max();
  if (*amount > kMaxBalance - current.balance) {
    events_.error("Deposit of " + std::to_string(*amount) + " to wallet " + *wallet_id +
                  " would exceed the maximum balance; current balance " + std::to_string(current.balance));
    out_ << "Deposit rejected. Balance cannot exceed " << kMaxBalance
         << " (current balance: " << current.balance << ")\n";
    return;
  }

  ledger_.append(ledger::Transaction{
      .kind = common::TransactionKind::kDeposit,
      .wallet_id = *wallet_id,
      .amount = *amount,
  });
  events_.info("Successful deposit of " + std::to_string(*amount) + " to wallet " + *wallet_id);
  out_ << "Successfully deposited " << *amount << " to the wallet\n";
}

void WalletTerminal::withdraw() {
  const auto wallet_id = prompt_wallet_id();
  if (!wallet_id) {
    return;
  }
  const auto amount = prompt_amount();
  if (!amount) {
    return;
  }

  if (*amount <= 0) {
    events_.error("Invalid withdrawal amount attempted: " + std::to_string(*amount));
    out_ << "Amount must be positive\n";
    return;
  }

  const auto result = ledger::compute_balance(ledger_.transactions(), *wallet_id, events_);
  if (!result.ok()) {
    const auto message = result.error->message();
    events_.error("Withdrawal error for wallet " + *wallet_id + ": " + message);
    out_ << "Error: " << message << '\n';
    return;
  }

  if (result.balance < *amount) {
    events_.error("Insufficient funds for withdrawal: requested " + std::to_string(*amount) +
                  ", available " + std::to_string(result.balance));
    out_ << "Insufficient funds. Available balance: " << result.balance << '\n';
    return;
  }

  ledger_.append(ledger::Transaction{
      .kind = common::TransactionKind::kWithdrawal,
      .wallet_id = *wallet_id,
      .amount = *amount,
  });
  events_.info("Successful withdrawal of " + std::to_string(*amount) + " from wallet " + *wallet_id);
  out_ << "Successfully withdrew " << *amount << " from the wallet\n";
}

void WalletTerminal::view_history() {
  const auto wallet_id = prompt_wallet_id();
  if (!wallet_id) {
    return;
  }

  events_.info("Viewing transaction history for wallet " + *wallet_id);
  out_ << "Transaction history for wallet " << *wallet_id << ":\n";
  for (const auto& entry : ledger::render_history(ledger_.transactions(), *wallet_id)) {
    out_ << *entry.transaction << " | Running balance: " << entry.running_balance << '\n';
  }
}

}  // namespace terminal
}  // namespace walletcore
