#include "test_report.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "payledger/ingest/transaction_reader.hpp"
#include "payledger/ledger/ledger_engine.hpp"
#include "payledger/report/report_writer.hpp"

namespace payledger::tests {

namespace {

std::vector<common::Record> sample_records() {
  return {
      ingest::parse_record(2, {"deposit", "2", "1", "5.0"}),
      ingest::parse_record(3, {"deposit", "1", "2", "1.23456"}),
      ingest::parse_record(4, {"dispute", "2", "1"}),
      ingest::parse_record(5, {"withdrawal", "1", "3", "9.0"}),
      ingest::parse_record(6, {"transfer", "1", "4", "1.0"}),
      ingest::parse_record(7, {"deposit", "1"}),
  };
}

std::string read_file(const std::filesystem::path& path) {
  std::ifstream in(path);
  std::ostringstream oss;
  oss << in.rdbuf();
  return oss.str();
}

}  // namespace

void test_report_rows() {
  const auto records = sample_records();
  ledger::LedgerEngine engine;
  engine.run(records);

  std::ostringstream accounts;
  assert(report::write_accounts(accounts, engine.accounts()) == 2);
  assert(accounts.str() ==
         "client,available,held,total,locked\n"
         "1,1.2346,0.0000,1.2346,false\n"
         "2,0.0000,5.0000,5.0000,false\n");

  std::ostringstream failed;
  assert(report::write_failed(failed, engine.failed()) == 3);
  const auto text = failed.str();
  assert(text.rfind("type,client,tx,amount,reason\n", 0) == 0);
  // Reasons containing commas are quoted.
  assert(text.find("withdrawal,1,3,9.0,\"insufficient_funds: ") != std::string::npos);
  assert(text.find("transfer,1,4,1.0,unrecognized_type: ") != std::string::npos);
  assert(text.find("deposit,1,,,\"parse_error: ") != std::string::npos);

  assert(report::escape_field("plain") == "plain");
  assert(report::escape_field("a,b") == "\"a,b\"");
  assert(report::escape_field("say \"hi\"") == "\"say \"\"hi\"\"\"");
}

void test_report_files() {
  namespace fs = std::filesystem;
  const auto tmp_root = fs::temp_directory_path() / "payledger_tests" / "reports";
  fs::remove_all(tmp_root);

  const auto records = sample_records();
  ledger::LedgerEngine engine;
  engine.run(records);

  const auto accounts_path = tmp_root / "out" / "accounts.csv";
  const auto failed_path = tmp_root / "out" / "failed.csv";
  report::write_accounts_file(accounts_path, engine.accounts());
  report::write_failed_file(failed_path, engine.failed());

  assert(fs::exists(accounts_path));
  assert(fs::exists(failed_path));

  std::ostringstream expected;
  report::write_accounts(expected, engine.accounts());
  assert(read_file(accounts_path) == expected.str());

  // Failed rows reparse into the original fields plus the reason column.
  std::ifstream in(failed_path);
  std::string line;
  std::getline(in, line);
  std::size_t rows = 0;
  while (std::getline(in, line)) {
    const auto fields = ingest::split_fields(line);
    assert(fields.size() == 5);
    assert(fields[4] == engine.failed()[rows].status.message());
    ++rows;
  }
  assert(rows == engine.failed().size());

  fs::remove_all(tmp_root);
}

void test_report_extra_fields() {
  namespace fs = std::filesystem;
  const auto tmp_root = fs::temp_directory_path() / "payledger_tests" / "extra_fields";
  fs::remove_all(tmp_root);

  auto records = sample_records();
  records.push_back(ingest::parse_record(8, {"withdrawal", "1", "5", "9.0", "", ""}));
  records.push_back(ingest::parse_record(9, {"deposit", "1", "6", "1.0", "extra"}));
  ledger::LedgerEngine engine;
  engine.run(records);
  assert(engine.failed().size() == 5);

  // Empty trailing values are dropped, others follow the reason.
  const auto& ragged = engine.failed()[3];
  assert(ragged.status.code == common::ErrorCode::kInsufficientFunds);
  assert(report::format_failed_row(ragged) ==
         "withdrawal,1,5,9.0,\"" + ragged.status.message() + "\"");
  const auto& extra = engine.failed()[4];
  assert(extra.status.code == common::ErrorCode::kParseError);
  assert(report::format_failed_row(extra) ==
         "deposit,1,6,1.0," + extra.status.message() + " (extra fields: 'extra')");

  const auto failed_path = tmp_root / "failed.csv";
  assert(report::write_failed_file(failed_path, engine.failed()) == 5);

  std::ifstream in(failed_path);
  std::string line;
  std::getline(in, line);
  std::size_t rows = 0;
  while (std::getline(in, line)) {
    const auto fields = ingest::split_fields(line);
    assert(fields.size() == 5);
    assert(fields[4].rfind(engine.failed()[rows].status.message(), 0) == 0);
    ++rows;
  }
  assert(rows == 5);

  fs::remove_all(tmp_root);
}

}  // namespace payledger::tests
