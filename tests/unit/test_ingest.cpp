#include "test_ingest.hpp"

#include <cassert>
#include <filesystem>
#include <sstream>
#include <stdexcept>

#include "payledger/ingest/transaction_reader.hpp"

namespace payledger::tests {

void test_split_fields() {
  auto fields = ingest::split_fields("  deposit ,1,  2 , 3.5  ");
  assert(fields.size() == 4);
  assert(fields[0] == "deposit");
  assert(fields[1] == "1");
  assert(fields[2] == "2");
  assert(fields[3] == "3.5");

  fields = ingest::split_fields("dispute,1,2,");
  assert(fields.size() == 4);
  assert(fields[3].empty());

  fields = ingest::split_fields("\"wire, intl\",1,\"say \"\"hi\"\"\"");
  assert(fields.size() == 3);
  assert(fields[0] == "wire, intl");
  assert(fields[2] == "say \"hi\"");
}

void test_parse_record() {
  auto record = ingest::parse_record(2, {"DePoSiT", "1", "10", "1.25"});
  assert(record.status.ok());
  assert(record.line == 2);
  assert(record.transaction.type == common::TransactionType::kDeposit);
  assert(record.transaction.client == 1);
  assert(record.transaction.tx == 10);
  assert(record.transaction.amount == 12'500);

  record = ingest::parse_record(3, {"chargeback", "4", "11"});
  assert(record.status.ok());
  assert(record.transaction.type == common::TransactionType::kChargeBack);
  assert(record.transaction.amount == 0);

  // Amounts on non-monetary rows are ignored.
  record = ingest::parse_record(4, {"resolve", "4", "11", "9.0"});
  assert(record.status.ok());
  assert(record.transaction.amount == 0);

  record = ingest::parse_record(5, {"Transfer", "4", "12", "1.0"});
  assert(record.status.ok());
  assert(record.transaction.type == common::TransactionType::kUnknown);
  assert(record.transaction.raw_type == "Transfer");

  record = ingest::parse_record(6, {"deposit", "1", "13", "1.0", "", ""});
  assert(record.status.ok());

  record = ingest::parse_record(7, {"deposit", "1"});
  assert(record.status.code == common::ErrorCode::kParseError);
  assert(record.fields.size() == 2);

  record = ingest::parse_record(8, {"deposit", "1", "14", "1.0", "extra"});
  assert(record.status.code == common::ErrorCode::kParseError);

  record = ingest::parse_record(9, {"deposit", "70000", "15", "1.0"});
  assert(record.status.code == common::ErrorCode::kParseError);
  assert(record.status.reason.find("client") != std::string::npos);

  record = ingest::parse_record(10, {"deposit", "1", "-2", "1.0"});
  assert(record.status.code == common::ErrorCode::kParseError);

  record = ingest::parse_record(11, {"", "1", "2", "1.0"});
  assert(record.status.code == common::ErrorCode::kParseError);

  record = ingest::parse_record(12, {"withdrawal", "1", "2", "1,0"});
  assert(record.status.code == common::ErrorCode::kParseError);
}

void test_transaction_reader() {
  std::istringstream input(
      "type,client,tx,amount\r\n"
      "deposit,1,1,1.0\r\n"
      "\r\n"
      "   \n"
      "  withdrawal ,  1 , 2 ,  0.5 \n"
      "dispute,1,1\n"
      "bogus\n");

  ingest::TransactionReader reader{input};
  common::Record record;

  assert(reader.next(record));
  assert(record.line == 2);
  assert(record.transaction.type == common::TransactionType::kDeposit);

  assert(reader.next(record));
  assert(record.line == 5);
  assert(record.transaction.type == common::TransactionType::kWithdrawal);
  assert(record.transaction.amount == 5'000);
  assert(record.fields[0] == "withdrawal");

  assert(reader.next(record));
  assert(record.line == 6);
  assert(record.transaction.type == common::TransactionType::kDispute);

  assert(reader.next(record));
  assert(record.line == 7);
  assert(record.status.code == common::ErrorCode::kParseError);

  assert(!reader.next(record));
  assert(reader.stats().lines == 7);
  assert(reader.stats().blank_lines == 2);
  assert(reader.stats().records == 4);
  assert(reader.stats().parse_errors == 1);

  // Without headers the first row is data.
  std::istringstream headless("deposit,5,1,2.0\n");
  ingest::TransactionReader headless_reader{headless, {.has_headers = false}};
  assert(headless_reader.next(record));
  assert(record.status.ok());
  assert(record.transaction.client == 5);
  assert(!headless_reader.next(record));
}

void test_transaction_reader_missing_file() {
  const auto missing = std::filesystem::temp_directory_path() / "payledger_tests" / "does_not_exist.csv";
  bool threw = false;
  try {
    ingest::TransactionReader reader{missing};
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

}  // namespace payledger::tests
