#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace payledger {
namespace config {

struct InputConfig {
  bool has_headers{true};
};

struct OutputConfig {
  std::filesystem::path accounts_path{"accounts.csv"};
  std::filesystem::path failed_path{"failed.csv"};
};

struct LedgerConfig {
  bool allow_redispute{false};
  bool withdraw_from_available{false};
};

struct ReportConfig {
  bool accounts_to_stdout{false};
  bool write_failed{true};
};

struct AppConfig {
  InputConfig input;
  OutputConfig output;
  LedgerConfig ledger;
  ReportConfig report;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  AppConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const AppConfig& config);
  static std::string generate_default();
};

}  // namespace config
}  // namespace payledger
