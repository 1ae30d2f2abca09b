#include "payledger/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <sstream>

namespace payledger {
namespace config {

namespace {

bool get_bool_or(const toml::table& tbl, std::string_view key, bool default_val) {
  if (auto val = tbl[key].value<bool>()) {
    return *val;
  }
  return default_val;
}

std::string get_str_or(const toml::table& tbl, std::string_view key, std::string_view default_val) {
  if (auto val = tbl[key].value<std::string_view>()) {
    return std::string(*val);
  }
  return std::string(default_val);
}

InputConfig parse_input(const toml::table& root) {
  InputConfig cfg;
  if (auto* input = root["input"].as_table()) {
    cfg.has_headers = get_bool_or(*input, "has_headers", cfg.has_headers);
  }
  return cfg;
}

OutputConfig parse_output(const toml::table& root) {
  OutputConfig cfg;
  if (auto* output = root["output"].as_table()) {
    cfg.accounts_path = get_str_or(*output, "accounts_path", cfg.accounts_path.string());
    cfg.failed_path = get_str_or(*output, "failed_path", cfg.failed_path.string());
  }
  return cfg;
}

LedgerConfig parse_ledger(const toml::table& root) {
  LedgerConfig cfg;
  if (auto* ledger = root["ledger"].as_table()) {
    cfg.allow_redispute = get_bool_or(*ledger, "allow_redispute", cfg.allow_redispute);
    cfg.withdraw_from_available = get_bool_or(*ledger, "withdraw_from_available", cfg.withdraw_from_available);
  }
  return cfg;
}

ReportConfig parse_report(const toml::table& root) {
  ReportConfig cfg;
  if (auto* report = root["report"].as_table()) {
    cfg.accounts_to_stdout = get_bool_or(*report, "accounts_to_stdout", cfg.accounts_to_stdout);
    cfg.write_failed = get_bool_or(*report, "write_failed", cfg.write_failed);
  }
  return cfg;
}

AppConfig parse_config(const toml::table& root) {
  AppConfig cfg;
  cfg.input = parse_input(root);
  cfg.output = parse_output(root);
  cfg.ledger = parse_ledger(root);
  cfg.report = parse_report(root);
  return cfg;
}

}  // namespace

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  LoadResult result;

  if (!std::filesystem::exists(path)) {
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }

  auto parse_result = toml::parse_file(path.string());
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parse_result.table());
  result.errors = validate(result.config);
  result.success = result.errors.empty();
  return result;
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  LoadResult result;

  auto parse_result = toml::parse(toml_content);
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parse_result.table());
  result.errors = validate(result.config);
  result.success = result.errors.empty();
  return result;
}

std::vector<ValidationError> ConfigLoader::validate(const AppConfig& config) {
  std::vector<ValidationError> errors;

  if (!config.report.accounts_to_stdout && config.output.accounts_path.empty()) {
    errors.push_back({"output.accounts_path", "accounts_path cannot be empty"});
  }

  if (config.report.write_failed && config.output.failed_path.empty()) {
    errors.push_back({"output.failed_path", "failed_path cannot be empty when report.write_failed is set"});
  }

  if (!config.report.accounts_to_stdout && config.report.write_failed &&
      !config.output.accounts_path.empty() &&
      config.output.accounts_path.lexically_normal() == config.output.failed_path.lexically_normal()) {
    errors.push_back({"output", "accounts_path and failed_path must differ"});
  }

  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# payledger configuration
# Generated default configuration

[input]
has_headers = true

[output]
accounts_path = "accounts.csv"
failed_path = "failed.csv"

[ledger]
allow_redispute = false          # reject a dispute on an already disputed transaction
withdraw_from_available = false  # check withdrawals against total, held funds included

[report]
accounts_to_stdout = false
write_failed = true
)";
}

}  // namespace config
}  // namespace payledger
