#include "payledger/ledger/ledger_engine.hpp"

#include <utility>

namespace payledger {
namespace ledger {

namespace {
constexpr common::Amount kMinimumAmount = 0;
}  // namespace

LedgerEngine::LedgerEngine(AccountPolicy policy, std::size_t arena_bytes)
    : policy_(policy),
      arena_(arena_bytes),
      accounts_(&arena_) {}

void LedgerEngine::run(common::RecordSource& source) {
  common::Record record;
  while (source.next(record)) {
    apply(record);
  }
}

void LedgerEngine::run(std::span<const common::Record> records) {
  for (const auto& record : records) {
    apply(record);
  }
}

bool LedgerEngine::apply(const common::Record& record) {
  ++stats_.records;

  if (!record.status.ok()) {
    record_failure(record, record.status);
    return false;
  }

  const auto& transaction = record.transaction;
  // A locked account rejects everything, so its lock is reported ahead of
  // record-level checks.
  const auto* existing = find_account(transaction.client);
  const bool locked = existing != nullptr && existing->locked();
  if (!locked) {
    if (auto status = validate(transaction); !status.ok()) {
      record_failure(record, std::move(status));
      return false;
    }
  }

  auto status = ensure_account(transaction.client).process_transaction(transaction);
  if (!status.ok()) {
    record_failure(record, std::move(status));
    return false;
  }

  ++stats_.applied;
  return true;
}

const Account* LedgerEngine::find_account(common::ClientId client) const {
  if (auto it = accounts_.find(client); it != accounts_.end()) {
    return &it->second;
  }
  return nullptr;
}

Account& LedgerEngine::ensure_account(common::ClientId client) {
  return accounts_.try_emplace(client, client, policy_).first->second;
}

// Checks that need no account state. Records rejected here never create one.
// Skipped for locked accounts.
common::Status LedgerEngine::validate(const common::Transaction& transaction) const {
  if (transaction.type == common::TransactionType::kUnknown) {
    return common::Status::failure(common::ErrorCode::kUnrecognizedType,
                                   "unrecognized transaction type '" + transaction.raw_type + "'");
  }
  if (common::is_monetary(transaction.type) && transaction.amount <= kMinimumAmount) {
    return common::Status::failure(common::ErrorCode::kInvalidAmount,
                                   std::string(common::to_string(transaction.type)) +
                                       " amount must be greater than " +
                                       common::format_amount(kMinimumAmount) + ", got " +
                                       common::format_amount(transaction.amount));
  }
  return common::Status::success();
}

void LedgerEngine::record_failure(const common::Record& record, common::Status status) {
  ++stats_.failed;
  ++stats_.failures_by_code[common::index_of(status.code)];
  failed_.push_back(FailedRecord{
      .line = record.line,
      .fields = record.fields,
      .status = std::move(status),
  });
}

}  // namespace ledger
}  // namespace payledger
