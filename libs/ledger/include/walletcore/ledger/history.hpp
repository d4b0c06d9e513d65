#pragma once

#include <cstddef>
#include <iterator>
#include <span>
#include <string>
#include <string_view>

#include "walletcore/common/types.hpp"
#include "walletcore/ledger/transaction.hpp"

namespace walletcore {
namespace ledger {

struct HistoryEntry {
  const Transaction* transaction{nullptr};
  common::Balance running_balance{0};  // after applying *transaction
};

// Lazy per-wallet history over a borrowed transaction sequence. Every call to
// begin() replays from the start, so the view can be iterated repeatedly.
//
// Unlike compute_balance this applies every matching amount as-is: a negative
// amount or an overdrawing withdrawal is shown, never rejected, and the
// running balance may go negative. Display relies on that; keep the two paths
// separate.
class HistoryView {
 public:
  class iterator {
   public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = HistoryEntry;
    using difference_type = std::ptrdiff_t;
    using pointer = const HistoryEntry*;
    using reference = const HistoryEntry&;

    iterator() = default;

    reference operator*() const noexcept { return entry_; }
    pointer operator->() const noexcept { return &entry_; }

    iterator& operator++();
    iterator operator++(int);

    friend bool operator==(const iterator& lhs, const iterator& rhs) noexcept {
      return lhs.index_ == rhs.index_;
    }

   private:
    friend class HistoryView;

    iterator(const HistoryView* view, std::size_t index);

    void settle();

    const HistoryView* view_{nullptr};
    std::size_t index_{0};
    HistoryEntry entry_{};
  };

  HistoryView(std::span<const Transaction> transactions, std::string wallet_id);

  [[nodiscard]] iterator begin() const;
  [[nodiscard]] iterator end() const;
  [[nodiscard]] const std::string& wallet_id() const noexcept { return wallet_id_; }

 private:
  std::span<const Transaction> transactions_;
  std::string wallet_id_;
};

[[nodiscard]] HistoryView render_history(std::span<const Transaction> transactions,
                                         std::string_view wallet_id);

}  // namespace ledger
}  // namespace walletcore
