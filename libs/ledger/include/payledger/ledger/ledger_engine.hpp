#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <memory_resource>
#include <span>
#include <string>
#include <vector>

#include "payledger/common/types.hpp"
#include "payledger/ledger/account.hpp"

namespace payledger {
namespace ledger {

struct FailedRecord {
  common::LineNumber line{0};
  std::vector<std::string> fields{};
  common::Status status{};
};

// Applies records in arrival order to one Account per client and collects
// every record that could not be applied. A failing record never stops the run.
class LedgerEngine {
 public:
  using AccountMap = std::pmr::map<common::ClientId, Account>;

  struct Stats {
    std::uint64_t records{0};
    std::uint64_t applied{0};
    std::uint64_t failed{0};
    std::array<std::uint64_t, common::kErrorCodeCount> failures_by_code{};
  };

  explicit LedgerEngine(AccountPolicy policy = {}, std::size_t arena_bytes = 1 << 16);
  LedgerEngine(const LedgerEngine&) = delete;
  LedgerEngine& operator=(const LedgerEngine&) = delete;

  void run(common::RecordSource& source);
  void run(std::span<const common::Record> records);

  // Returns true if the record was applied to an account.
  bool apply(const common::Record& record);

  [[nodiscard]] const AccountMap& accounts() const noexcept { return accounts_; }
  [[nodiscard]] const std::vector<FailedRecord>& failed() const noexcept { return failed_; }
  [[nodiscard]] const Account* find_account(common::ClientId client) const;
  [[nodiscard]] const Stats& stats() const noexcept { return stats_; }
  [[nodiscard]] std::uint64_t failures(common::ErrorCode code) const noexcept {
    return stats_.failures_by_code[common::index_of(code)];
  }

 private:
  AccountPolicy policy_;
  std::pmr::monotonic_buffer_resource arena_;
  AccountMap accounts_;
  std::vector<FailedRecord> failed_{};
  Stats stats_{};

  Account& ensure_account(common::ClientId client);
  common::Status validate(const common::Transaction& transaction) const;
  void record_failure(const common::Record& record, common::Status status);
};

}  // namespace ledger
}  // namespace payledger
