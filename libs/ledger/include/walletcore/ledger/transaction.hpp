#pragma once

#include <iosfwd>
#include <string>

#include "walletcore/common/types.hpp"

namespace walletcore {
namespace ledger {

struct Transaction {
  common::TransactionKind kind{common::TransactionKind::kDeposit};
  common::WalletId wallet_id{};
  common::Amount amount{0};
};

// "<Kind> of <amount> to <wallet_id>", used for both deposits and withdrawals.
[[nodiscard]] std::string describe(const Transaction& tx);
std::ostream& operator<<(std::ostream& os, const Transaction& tx);

}  // namespace ledger
}  // namespace walletcore
