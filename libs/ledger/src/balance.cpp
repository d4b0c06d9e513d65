#include "walletcore/ledger/balance.hpp"

namespace walletcore {
namespace ledger {

WalletError WalletError::invalid_amount(common::Amount amount) noexcept {
  return WalletError{.code = ErrorCode::kInvalidAmount, .amount = amount};
}

WalletError WalletError::insufficient_funds(common::Amount requested,
                                            common::Balance available) noexcept {
  return WalletError{.code = ErrorCode::kInsufficientFunds,
                     .requested = requested,
                     .available = available};
}

std::string WalletError::message() const {
  switch (code) {
    case ErrorCode::kInvalidAmount:
      return "Invalid transaction amount: " + std::to_string(amount);
    case ErrorCode::kInsufficientFunds:
      return "Insufficient funds for withdrawal of " + std::to_string(requested) +
             ". Available balance: " + std::to_string(available);
  }
  return "Unknown wallet error";
}

BalanceResult compute_balance(std::span<const Transaction> transactions,
                              std::string_view wallet_id,
                              telemetry::EventSink& events) {
  common::Balance balance = 0;

  for (const auto& tx : transactions) {
    if (tx.wallet_id != wallet_id) {
      continue;
    }

    if (tx.amount < 0) {
      events.error("Invalid transaction amount: " + std::to_string(tx.amount) +
                   " in transaction " + describe(tx));
      return BalanceResult{.error = WalletError::invalid_amount(tx.amount)};
    }

    switch (tx.kind) {
      case common::TransactionKind::kDeposit:
        events.info("Deposit of " + std::to_string(tx.amount) + " to " + tx.wallet_id);
        balance += tx.amount;
        break;
      case common::TransactionKind::kWithdrawal:
        if (balance < tx.amount) {
          events.error("Insufficient funds for withdrawal of " + std::to_string(tx.amount) +
                       " from " + tx.wallet_id + ". Available balance: " + std::to_string(balance));
          return BalanceResult{.error = WalletError::insufficient_funds(tx.amount, balance)};
        }
        events.info("Withdrawal of " + std::to_string(tx.amount) + " from " + tx.wallet_id);
        balance -= tx.amount;
        break;
    }
  }

  events.info("Final balance for wallet " + std::string(wallet_id) + ": " + std::to_string(balance));
  return BalanceResult{.balance = balance};
}

BalanceResult compute_balance(std::span<const Transaction> transactions,
                              std::string_view wallet_id) {
  telemetry::DiscardSink discard;
  return compute_balance(transactions, wallet_id, discard);
}

}  // namespace ledger
}  // namespace walletcore
