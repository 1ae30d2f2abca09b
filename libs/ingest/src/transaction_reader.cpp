#include "payledger/ingest/transaction_reader.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <stdexcept>
#include <utility>

namespace payledger {
namespace ingest {

namespace {

constexpr std::size_t kTypeField = 0;
constexpr std::size_t kClientField = 1;
constexpr std::size_t kTxField = 2;
constexpr std::size_t kAmountField = 3;
constexpr std::size_t kMinFields = 3;

bool is_space(char c) noexcept {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim(std::string_view text) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end && is_space(text[begin])) {
    ++begin;
  }
  while (end > begin && is_space(text[end - 1])) {
    --end;
  }
  return std::string(text.substr(begin, end - begin));
}

template <typename T>
std::optional<T> parse_unsigned(std::string_view text) noexcept {
  T value{};
  const auto* first = text.data();
  const auto* last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (text.empty() || ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return value;
}

void mark_parse_error(common::Record& record, std::string reason) {
  record.status = common::Status::failure(common::ErrorCode::kParseError, std::move(reason));
}

bool iequals(std::string_view lhs, std::string_view rhs) noexcept {
  return lhs.size() == rhs.size() &&
         std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
           return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
         });
}

}  // namespace

std::vector<std::string> split_fields(std::string_view line) {
  std::vector<std::string> fields;
  std::string current;
  bool in_quotes = false;
  bool quoted = false;

  auto finish_field = [&]() {
    fields.push_back(quoted ? current : trim(current));
    current.clear();
    quoted = false;
  };

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (in_quotes) {
      if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
        current.push_back('"');
        ++i;
      } else if (c == '"') {
        in_quotes = false;
      } else {
        current.push_back(c);
      }
      continue;
    }

    if (c == ',') {
      finish_field();
    } else if (c == '"' && trim(current).empty()) {
      current.clear();
      in_quotes = true;
      quoted = true;
    } else if (!(quoted && is_space(c))) {
      current.push_back(c);
    }
  }
  finish_field();
  return fields;
}

common::TransactionType parse_transaction_type(std::string_view token) noexcept {
  if (iequals(token, "deposit")) {
    return common::TransactionType::kDeposit;
  }
  if (iequals(token, "withdrawal")) {
    return common::TransactionType::kWithdrawal;
  }
  if (iequals(token, "dispute")) {
    return common::TransactionType::kDispute;
  }
  if (iequals(token, "resolve")) {
    return common::TransactionType::kResolve;
  }
  if (iequals(token, "chargeback")) {
    return common::TransactionType::kChargeBack;
  }
  return common::TransactionType::kUnknown;
}

common::Record parse_record(common::LineNumber line, std::vector<std::string> fields) {
  common::Record record;
  record.line = line;
  record.fields = std::move(fields);
  const auto& row = record.fields;

  // Ragged rows may carry empty trailing columns.
  std::size_t used = row.size();
  while (used > kMinFields && row[used - 1].empty()) {
    --used;
  }

  if (used < kMinFields) {
    mark_parse_error(record, "expected at least 3 fields (type, client, tx), got " + std::to_string(row.size()));
    return record;
  }
  if (used > kAmountField + 1) {
    mark_parse_error(record, "unexpected value '" + row[used - 1] + "' after the amount column");
    return record;
  }

  const auto& type_token = row[kTypeField];
  if (type_token.empty()) {
    mark_parse_error(record, "missing transaction type");
    return record;
  }

  const auto client = parse_unsigned<common::ClientId>(row[kClientField]);
  if (!client) {
    mark_parse_error(record, "invalid client id '" + row[kClientField] + "'");
    return record;
  }

  const auto tx = parse_unsigned<common::TxId>(row[kTxField]);
  if (!tx) {
    mark_parse_error(record, "invalid transaction id '" + row[kTxField] + "'");
    return record;
  }

  common::Amount amount = 0;
  if (used > kAmountField && !row[kAmountField].empty()) {
    const auto parsed = common::parse_amount(row[kAmountField]);
    if (!parsed) {
      mark_parse_error(record, "invalid amount '" + row[kAmountField] + "'");
      return record;
    }
    amount = *parsed;
  }

  auto& transaction = record.transaction;
  transaction.type = parse_transaction_type(type_token);
  transaction.client = *client;
  transaction.tx = *tx;
  transaction.amount = common::is_monetary(transaction.type) ? amount : 0;
  if (transaction.type == common::TransactionType::kUnknown) {
    transaction.raw_type = type_token;
  }
  record.status = common::Status::success();
  return record;
}

TransactionReader::TransactionReader(const std::filesystem::path& path, ReaderOptions options)
    : file_(std::make_unique<std::ifstream>(path)), options_(options) {
  if (!file_->is_open()) {
    throw std::runtime_error("failed to open transactions file: " + path.string());
  }
  stream_ = file_.get();
}

TransactionReader::TransactionReader(std::istream& stream, ReaderOptions options)
    : stream_(&stream), options_(options) {}

bool TransactionReader::next(common::Record& out_record) {
  std::string line;
  while (std::getline(*stream_, line)) {
    ++stats_.lines;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (trim(line).empty()) {
      ++stats_.blank_lines;
      continue;
    }

    auto fields = split_fields(line);
    if (!header_checked_) {
      header_checked_ = true;
      if (options_.has_headers && iequals(fields.front(), "type")) {
        continue;
      }
    }

    out_record = parse_record(stats_.lines, std::move(fields));
    ++stats_.records;
    if (!out_record.status.ok()) {
      ++stats_.parse_errors;
    }
    return true;
  }

  if (stream_->bad()) {
    throw std::runtime_error("failed reading transactions stream");
  }
  return false;
}

}  // namespace ingest
}  // namespace payledger
