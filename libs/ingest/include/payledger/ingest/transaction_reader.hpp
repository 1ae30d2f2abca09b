#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "payledger/common/types.hpp"

namespace payledger {
namespace ingest {

// Splits one CSV line into trimmed fields. Double-quoted fields may contain
// commas; a doubled quote inside them is a literal quote.
[[nodiscard]] std::vector<std::string> split_fields(std::string_view line);

// Case-insensitive match of the type column.
[[nodiscard]] common::TransactionType parse_transaction_type(std::string_view token) noexcept;

// Builds a record from the fields of one row. Malformed rows come back with a
// kParseError status instead of throwing.
[[nodiscard]] common::Record parse_record(common::LineNumber line, std::vector<std::string> fields);

struct ReaderOptions {
  // Skip a leading row whose first column is "type".
  bool has_headers{true};
};

// Reads `type,client,tx,amount` rows from a line-oriented stream.
class TransactionReader : public common::RecordSource {
 public:
  struct Stats {
    std::uint64_t lines{0};
    std::uint64_t blank_lines{0};
    std::uint64_t records{0};
    std::uint64_t parse_errors{0};
  };

  // Throws std::runtime_error if the file cannot be opened.
  explicit TransactionReader(const std::filesystem::path& path, ReaderOptions options = {});
  explicit TransactionReader(std::istream& stream, ReaderOptions options = {});
  TransactionReader(const TransactionReader&) = delete;
  TransactionReader& operator=(const TransactionReader&) = delete;

  bool next(common::Record& out_record) override;

  [[nodiscard]] const Stats& stats() const noexcept { return stats_; }

 private:
  std::unique_ptr<std::ifstream> file_{};
  std::istream* stream_{nullptr};
  ReaderOptions options_{};
  Stats stats_{};
  bool header_checked_{false};
};

}  // namespace ingest
}  // namespace payledger
