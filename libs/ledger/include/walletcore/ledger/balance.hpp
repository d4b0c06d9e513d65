#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "walletcore/common/types.hpp"
#include "walletcore/ledger/transaction.hpp"
#include "walletcore/telemetry/telemetry_sink.hpp"

namespace walletcore {
namespace ledger {

enum class ErrorCode : std::uint8_t {
  kInvalidAmount,
  kInsufficientFunds,
};

struct WalletError {
  ErrorCode code{ErrorCode::kInvalidAmount};
  common::Amount amount{0};      // kInvalidAmount: the offending stored amount
  common::Amount requested{0};   // kInsufficientFunds
  common::Balance available{0};  // kInsufficientFunds: running balance before the withdrawal

  [[nodiscard]] static WalletError invalid_amount(common::Amount amount) noexcept;
  [[nodiscard]] static WalletError insufficient_funds(common::Amount requested,
                                                      common::Balance available) noexcept;

  [[nodiscard]] std::string message() const;

  friend bool operator==(const WalletError&, const WalletError&) = default;
};

struct BalanceResult {
  common::Balance balance{0};
  std::optional<WalletError> error{};

  [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }
};

// Replays the wallet's transactions in insertion order starting from zero.
// Stops at the first negative amount or the first withdrawal larger than the
// running balance; the partial balance is not reported in that case.
[[nodiscard]] BalanceResult compute_balance(std::span<const Transaction> transactions,
                                            std::string_view wallet_id,
                                            telemetry::EventSink& events);
[[nodiscard]] BalanceResult compute_balance(std::span<const Transaction> transactions,
                                            std::string_view wallet_id);

}  // namespace ledger
}  // namespace walletcore
