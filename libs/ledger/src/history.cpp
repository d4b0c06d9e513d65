#include "walletcore/ledger/history.hpp"

#include <utility>

namespace walletcore {
namespace ledger {

HistoryView::iterator::iterator(const HistoryView* view, std::size_t index)
    : view_(view), index_(index) {
  settle();
}

HistoryView::iterator& HistoryView::iterator::operator++() {
  ++index_;
  settle();
  return *this;
}

HistoryView::iterator HistoryView::iterator::operator++(int) {
  auto copy = *this;
  ++(*this);
  return copy;
}

// Moves index_ onto the next transaction of the wallet (or to the end) and
// folds it into the running balance.
void HistoryView::iterator::settle() {
  const auto& transactions = view_->transactions_;
  while (index_ < transactions.size() && transactions[index_].wallet_id != view_->wallet_id_) {
    ++index_;
  }
  if (index_ >= transactions.size()) {
    index_ = transactions.size();
    entry_.transaction = nullptr;
    return;
  }

  const auto& tx = transactions[index_];
  switch (tx.kind) {
    case common::TransactionKind::kDeposit:
      entry_.running_balance += tx.amount;
      break;
    case common::TransactionKind::kWithdrawal:
      entry_.running_balance -= tx.amount;
      break;
  }
  entry_.transaction = &tx;
}

HistoryView::HistoryView(std::span<const Transaction> transactions, std::string wallet_id)
    : transactions_(transactions), wallet_id_(std::move(wallet_id)) {}

HistoryView::iterator HistoryView::begin() const {
  return iterator(this, 0);
}

HistoryView::iterator HistoryView::end() const {
  return iterator(this, transactions_.size());
}

HistoryView render_history(std::span<const Transaction> transactions, std::string_view wallet_id) {
  return HistoryView(transactions, std::string(wallet_id));
}

}  // namespace ledger
}  // namespace walletcore
