#pragma once

#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "payledger/ledger/account.hpp"
#include "payledger/ledger/ledger_engine.hpp"

namespace payledger {
namespace report {

inline constexpr std::string_view kAccountsHeader = "client,available,held,total,locked";
inline constexpr std::string_view kFailedHeader = "type,client,tx,amount,reason";

// Quotes a field if it contains a comma, quote or line break.
[[nodiscard]] std::string escape_field(std::string_view field);

[[nodiscard]] std::string format_account_row(const ledger::Account& account);
[[nodiscard]] std::string format_failed_row(const ledger::FailedRecord& record);

std::size_t write_accounts(std::ostream& out, const ledger::LedgerEngine::AccountMap& accounts);
std::size_t write_failed(std::ostream& out, const std::vector<ledger::FailedRecord>& failed);

// File variants create missing parent directories and throw
// std::runtime_error when the target cannot be opened or written.
std::size_t write_accounts_file(const std::filesystem::path& path,
                                const ledger::LedgerEngine::AccountMap& accounts);
std::size_t write_failed_file(const std::filesystem::path& path,
                              const std::vector<ledger::FailedRecord>& failed);

}  // namespace report
}  // namespace payledger
