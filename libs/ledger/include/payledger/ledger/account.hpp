#pragma once

#include <cstddef>
#include <map>

#include "payledger/common/types.hpp"

namespace payledger {
namespace ledger {

struct AccountPolicy {
  // When false a second dispute on an already disputed transaction is rejected.
  // When true the amount is moved to held again.
  bool allow_redispute{false};
  // Check withdrawals against available funds instead of the total balance.
  bool withdraw_from_available{false};
};

struct StoredTransaction {
  common::Transaction transaction{};
  bool disputed{false};
};

// Balances and monetary history of a single client.
//
// Every mutating operation either succeeds or leaves the account untouched.
// total() == available() + held() holds after each successful call.
class Account {
 public:
  explicit Account(common::ClientId client, AccountPolicy policy = {});

  common::Status deposit(common::Amount amount);
  common::Status withdraw(common::Amount amount);
  common::Status dispute(common::TxId tx);
  common::Status resolve(common::TxId tx);
  common::Status charge_back(common::TxId tx);

  // Dispatches on the transaction type. Locked accounts reject everything.
  common::Status process_transaction(const common::Transaction& transaction);

  [[nodiscard]] common::ClientId client() const noexcept { return client_; }
  [[nodiscard]] common::Amount available() const noexcept { return available_; }
  [[nodiscard]] common::Amount held() const noexcept { return held_; }
  [[nodiscard]] common::Amount total() const noexcept { return total_; }
  [[nodiscard]] bool locked() const noexcept { return locked_; }

  [[nodiscard]] const StoredTransaction* find_transaction(common::TxId tx) const;
  [[nodiscard]] std::size_t transaction_count() const noexcept { return transactions_.size(); }

 private:
  common::ClientId client_;
  AccountPolicy policy_;
  common::Amount available_{0};
  common::Amount held_{0};
  common::Amount total_{0};
  bool locked_{false};
  std::map<common::TxId, StoredTransaction> transactions_{};

  void store(const common::Transaction& transaction);
};

}  // namespace ledger
}  // namespace payledger
