#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "payledger/common/amount.hpp"
#include "payledger/common/status.hpp"

namespace payledger {
namespace common {

using ClientId = std::uint16_t;
using TxId = std::uint32_t;
using LineNumber = std::uint64_t;

enum class TransactionType : std::uint8_t {
  kDeposit,
  kWithdrawal,
  kDispute,
  kResolve,
  kChargeBack,
  kUnknown,
};

inline constexpr std::string_view to_string(TransactionType type) noexcept {
  switch (type) {
    case TransactionType::kDeposit:
      return "deposit";
    case TransactionType::kWithdrawal:
      return "withdrawal";
    case TransactionType::kDispute:
      return "dispute";
    case TransactionType::kResolve:
      return "resolve";
    case TransactionType::kChargeBack:
      return "chargeback";
    case TransactionType::kUnknown:
      break;
  }
  return "unknown";
}

// Deposits and withdrawals carry an amount and are kept in account history.
inline constexpr bool is_monetary(TransactionType type) noexcept {
  return type == TransactionType::kDeposit || type == TransactionType::kWithdrawal;
}

struct Transaction {
  TransactionType type{TransactionType::kUnknown};
  ClientId client{0};
  TxId tx{0};
  Amount amount{0};
  std::string raw_type{};  // original token, only set for kUnknown
};

// One input row as produced by a record source. `status` carries the parse
// outcome; `transaction` is meaningful only when it is ok.
struct Record {
  LineNumber line{0};
  std::vector<std::string> fields{};
  Transaction transaction{};
  Status status{};
};

class RecordSource {
 public:
  virtual ~RecordSource() = default;

  // Returns false once the source is exhausted.
  virtual bool next(Record& out_record) = 0;
};

}  // namespace common
}  // namespace payledger
