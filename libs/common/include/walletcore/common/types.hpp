#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace walletcore {
namespace common {

using WalletId = std::string;
using Amount = std::int64_t;
using Balance = std::int64_t;

enum class TransactionKind : std::uint8_t {
  kDeposit,
  kWithdrawal,
};

inline constexpr std::string_view to_string(TransactionKind kind) noexcept {
  switch (kind) {
    case TransactionKind::kDeposit:
      return "Deposit";
    case TransactionKind::kWithdrawal:
      return "Withdrawal";
  }
  return "Unknown";
}

}  // namespace common
}  // namespace walletcore
