#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include "walletcore/ledger/transaction.hpp"

namespace walletcore {
namespace ledger {

// Append-only, insertion-ordered transaction log for one session.
class LedgerState {
 public:
  void append(Transaction tx);

  [[nodiscard]] std::span<const Transaction> transactions() const noexcept { return transactions_; }
  [[nodiscard]] std::size_t size() const noexcept { return transactions_.size(); }
  [[nodiscard]] bool empty() const noexcept { return transactions_.empty(); }

 private:
  std::vector<Transaction> transactions_{};
};

}  // namespace ledger
}  // namespace walletcore
