#include "walletcore/ledger/ledger_state.hpp"

#include <utility>

namespace walletcore {
namespace ledger {

void LedgerState::append(Transaction tx) {
  transactions_.push_back(std::move(tx));
}

}  // namespace ledger
}  // namespace walletcore
