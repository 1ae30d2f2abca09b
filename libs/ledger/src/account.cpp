#include "payledger/ledger/account.hpp"

#include <limits>
#include <string>

namespace payledger {
namespace ledger {

namespace {

using common::ErrorCode;
using common::Status;

Status unknown_transaction(std::string_view operation, common::TxId tx) {
  return Status::failure(ErrorCode::kUnknownTransaction,
                         "cannot " + std::string(operation) + " transaction " + std::to_string(tx) +
                             ", no deposit or withdrawal with that id");
}

Status not_disputed(std::string_view operation, common::TxId tx) {
  return Status::failure(ErrorCode::kNotDisputed,
                         "cannot " + std::string(operation) + " transaction " + std::to_string(tx) +
                             ", it is not under dispute");
}

// True when lhs + rhs is representable as an Amount.
bool fits_sum(common::Amount lhs, common::Amount rhs) noexcept {
  if (rhs > 0) {
    return lhs <= std::numeric_limits<common::Amount>::max() - rhs;
  }
  return lhs >= std::numeric_limits<common::Amount>::min() - rhs;
}

Status balance_overflow(std::string_view operation, common::Amount amount) {
  return Status::failure(ErrorCode::kInvalidAmount,
                         "balance overflow: cannot " + std::string(operation) + " " +
                             common::format_amount(amount));
}

}  // namespace

Account::Account(common::ClientId client, AccountPolicy policy)
    : client_(client), policy_(policy) {}

Status Account::deposit(common::Amount amount) {
  if (amount < 0) {
    return Status::failure(ErrorCode::kInvalidAmount,
                           "deposit amount " + common::format_amount(amount) + " is negative");
  }
  if (!fits_sum(available_, amount) || !fits_sum(total_, amount)) {
    return balance_overflow("deposit", amount);
  }
  available_ += amount;
  total_ += amount;
  return Status::success();
}

Status Account::withdraw(common::Amount amount) {
  if (amount < 0) {
    return Status::failure(ErrorCode::kInvalidAmount,
                           "withdrawal amount " + common::format_amount(amount) + " is negative");
  }
  const common::Amount funds = policy_.withdraw_from_available ? available_ : total_;
  if (amount > funds) {
    return Status::failure(ErrorCode::kInsufficientFunds,
                           "cannot withdraw " + common::format_amount(amount) + ", " +
                               (policy_.withdraw_from_available ? "available" : "total") + " is " +
                               common::format_amount(funds));
  }
  if (!fits_sum(available_, -amount) || !fits_sum(total_, -amount)) {
    return balance_overflow("withdraw", amount);
  }
  available_ -= amount;
  total_ -= amount;
  return Status::success();
}

Status Account::dispute(common::TxId tx) {
  auto it = transactions_.find(tx);
  if (it == transactions_.end()) {
    return unknown_transaction("dispute", tx);
  }
  auto& original = it->second;
  if (original.disputed && !policy_.allow_redispute) {
    return Status::failure(ErrorCode::kAlreadyDisputed,
                           "transaction " + std::to_string(tx) + " is already under dispute");
  }
  const common::Amount amount = original.transaction.amount;
  if (!fits_sum(available_, -amount) || !fits_sum(held_, amount)) {
    return balance_overflow("dispute", amount);
  }
  available_ -= amount;
  held_ += amount;
  original.disputed = true;
  return Status::success();
}

Status Account::resolve(common::TxId tx) {
  auto it = transactions_.find(tx);
  if (it == transactions_.end()) {
    return unknown_transaction("resolve", tx);
  }
  auto& original = it->second;
  if (!original.disputed) {
    return not_disputed("resolve", tx);
  }
  const common::Amount amount = original.transaction.amount;
  if (!fits_sum(available_, amount) || !fits_sum(held_, -amount)) {
    return balance_overflow("resolve", amount);
  }
  available_ += amount;
  held_ -= amount;
  original.disputed = false;
  return Status::success();
}

Status Account::charge_back(common::TxId tx) {
  auto it = transactions_.find(tx);
  if (it == transactions_.end()) {
    return unknown_transaction("charge back", tx);
  }
  auto& original = it->second;
  if (!original.disputed) {
    return not_disputed("charge back", tx);
  }
  const common::Amount amount = original.transaction.amount;
  if (!fits_sum(held_, -amount) || !fits_sum(total_, -amount)) {
    return balance_overflow("charge back", amount);
  }
  held_ -= amount;
  total_ -= amount;
  original.disputed = false;
  locked_ = true;
  return Status::success();
}

Status Account::process_transaction(const common::Transaction& transaction) {
  if (locked_) {
    return Status::failure(ErrorCode::kAccountLocked,
                           "account " + std::to_string(client_) + " is locked");
  }

  switch (transaction.type) {
    case common::TransactionType::kDeposit: {
      auto status = deposit(transaction.amount);
      if (status.ok()) {
        store(transaction);
      }
      return status;
    }
    case common::TransactionType::kWithdrawal: {
      auto status = withdraw(transaction.amount);
      if (status.ok()) {
        store(transaction);
      }
      return status;
    }
    case common::TransactionType::kDispute:
      return dispute(transaction.tx);
    case common::TransactionType::kResolve:
      return resolve(transaction.tx);
    case common::TransactionType::kChargeBack:
      return charge_back(transaction.tx);
    case common::TransactionType::kUnknown:
      break;
  }
  return Status::failure(ErrorCode::kUnrecognizedType,
                         "unrecognized transaction type '" + transaction.raw_type + "'");
}

const StoredTransaction* Account::find_transaction(common::TxId tx) const {
  if (auto it = transactions_.find(tx); it != transactions_.end()) {
    return &it->second;
  }
  return nullptr;
}

// Last write wins for a reused transaction id.
void Account::store(const common::Transaction& transaction) {
  transactions_.insert_or_assign(transaction.tx, StoredTransaction{.transaction = transaction, .disputed = false});
}

}  // namespace ledger
}  // namespace payledger
