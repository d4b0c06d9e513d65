#include "walletcore/ledger/transaction.hpp"

#include <ostream>

namespace walletcore {
namespace ledger {

std::string describe(const Transaction& tx) {
  std::string out{common::to_string(tx.kind)};
  out += " of ";
  out += std::to_string(tx.amount);
  out += " to ";
  out += tx.wallet_id;
  return out;
}

std::ostream& operator<<(std::ostream& os, const Transaction& tx) {
  return os << common::to_string(tx.kind) << " of " << tx.amount << " to " << tx.wallet_id;
}

}  // namespace ledger
}  // namespace walletcore
