#include "payledger/report/report_writer.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>

namespace payledger {
namespace report {

namespace {

// Failed rows are padded to the four input columns before the reason.
constexpr std::size_t kInputColumns = 4;

std::ofstream open_output(const std::filesystem::path& path) {
  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      throw std::runtime_error("failed to create output directory " + path.parent_path().string() +
                               ": " + ec.message());
    }
  }
  std::ofstream out(path, std::ios::out | std::ios::trunc);
  if (!out.is_open()) {
    throw std::runtime_error("failed to open output file: " + path.string());
  }
  return out;
}

void finish(std::ofstream& out, const std::filesystem::path& path) {
  out.flush();
  if (!out) {
    throw std::runtime_error("failed to write output file: " + path.string());
  }
}

}  // namespace

std::string escape_field(std::string_view field) {
  if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
    return std::string(field);
  }
  std::string quoted = "\"";
  for (const char c : field) {
    if (c == '"') {
      quoted += '"';
    }
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

std::string format_account_row(const ledger::Account& account) {
  std::string row = std::to_string(account.client());
  row += ',';
  row += common::format_amount(account.available());
  row += ',';
  row += common::format_amount(account.held());
  row += ',';
  row += common::format_amount(account.total());
  row += ',';
  row += account.locked() ? "true" : "false";
  return row;
}

// Always four input columns then the reason. Values past the amount column
// are appended to the reason so the reason stays in the fifth column.
std::string format_failed_row(const ledger::FailedRecord& record) {
  const auto& fields = record.fields;
  std::size_t used = fields.size();
  while (used > kInputColumns && fields[used - 1].empty()) {
    --used;
  }

  std::string row;
  for (std::size_t i = 0; i < kInputColumns; ++i) {
    if (i < used) {
      row += escape_field(fields[i]);
    }
    row += ',';
  }

  std::string reason = record.status.message();
  if (used > kInputColumns) {
    reason += " (extra fields:";
    for (std::size_t i = kInputColumns; i < used; ++i) {
      reason += " '" + fields[i] + "'";
    }
    reason += ')';
  }
  row += escape_field(reason);
  return row;
}

std::size_t write_accounts(std::ostream& out, const ledger::LedgerEngine::AccountMap& accounts) {
  out << kAccountsHeader << '\n';
  for (const auto& [client, account] : accounts) {
    out << format_account_row(account) << '\n';
  }
  return accounts.size();
}

std::size_t write_failed(std::ostream& out, const std::vector<ledger::FailedRecord>& failed) {
  out << kFailedHeader << '\n';
  for (const auto& record : failed) {
    out << format_failed_row(record) << '\n';
  }
  return failed.size();
}

std::size_t write_accounts_file(const std::filesystem::path& path,
                                const ledger::LedgerEngine::AccountMap& accounts) {
  auto out = open_output(path);
  const auto written = write_accounts(out, accounts);
  finish(out, path);
  return written;
}

std::size_t write_failed_file(const std::filesystem::path& path,
                              const std::vector<ledger::FailedRecord>& failed) {
  auto out = open_output(path);
  const auto written = write_failed(out, failed);
  finish(out, path);
  return written;
}

}  // namespace report
}  // namespace payledger
