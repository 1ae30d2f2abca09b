#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <utility>

#include "payledger/common/status.hpp"
#include "payledger/config/config_loader.hpp"
#include "payledger/ingest/transaction_reader.hpp"
#include "payledger/ledger/ledger_engine.hpp"
#include "payledger/report/report_writer.hpp"

namespace {

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " <transactions.csv> [config_file]\n"
            << "  transactions.csv: CSV with columns type,client,tx,amount\n"
            << "  config_file:      Path to TOML configuration file\n"
            << "                    If not specified, uses ./payledger.toml or built-in defaults\n";
}

std::filesystem::path find_config_path(int argc, char* argv[]) {
  if (argc > 2) {
    return std::filesystem::path{argv[2]};
  }

  std::filesystem::path default_paths[] = {
      "./payledger.toml",
      std::filesystem::path{std::getenv("HOME") ? std::getenv("HOME") : ""} / ".config/payledger/payledger.toml",
  };

  for (const auto& path : default_paths) {
    if (!path.empty() && std::filesystem::exists(path)) {
      return path;
    }
  }

  return {};
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace payledger;

  if (argc < 2) {
    print_usage(argv[0]);
    return 1;
  }

  const std::filesystem::path input_path{argv[1]};
  const auto config_path = find_config_path(argc, argv);

  auto result = config_path.empty()
                    ? config::ConfigLoader::load_from_string(config::ConfigLoader::generate_default())
                    : config::ConfigLoader::load(config_path);
  if (!result.success) {
    if (!result.raw_error.empty()) {
      std::cerr << "Parse error: " << result.raw_error << "\n";
    }
    for (const auto& err : result.errors) {
      std::cerr << "Validation error [" << err.field << "]: " << err.message << "\n";
    }
    return 1;
  }
  const config::AppConfig cfg = std::move(result.config);

  // Keep stdout clean for CSV when the accounts go there.
  std::ostream& console = cfg.report.accounts_to_stdout ? std::cerr : std::cout;
  if (config_path.empty()) {
    console << "No config file found, using defaults\n";
  } else {
    console << "Loading config from: " << config_path << "\n";
  }

  ledger::LedgerEngine engine{ledger::AccountPolicy{
      .allow_redispute = cfg.ledger.allow_redispute,
      .withdraw_from_available = cfg.ledger.withdraw_from_available,
  }};

  try {
    ingest::TransactionReader reader{input_path, {.has_headers = cfg.input.has_headers}};
    engine.run(reader);
    console << "Read " << reader.stats().records << " records from " << input_path << " ("
        << reader.stats().parse_errors << " malformed)\n";

    if (cfg.report.accounts_to_stdout) {
      report::write_accounts(std::cout, engine.accounts());
      std::cout.flush();
    } else {
      report::write_accounts_file(cfg.output.accounts_path, engine.accounts());
      console << "Accounts written to: " << cfg.output.accounts_path << "\n";
    }

    if (cfg.report.write_failed) {
      report::write_failed_file(cfg.output.failed_path, engine.failed());
      console << "Failed transactions written to: " << cfg.output.failed_path << "\n";
    }
  } catch (const std::exception& ex) {
    std::cerr << "Fatal: " << ex.what() << "\n";
    return 1;
  }

  const auto& stats = engine.stats();
  console << "A total of " << engine.accounts().size() << " accounts were found!\n";
  console << "A total of " << stats.failed << " transactions have failed!\n";
  for (const auto code : common::kAllErrorCodes) {
    if (const auto count = engine.failures(code); count > 0) {
      console << "  " << common::to_string(code) << ": " << count << "\n";
    }
  }
  console << "transactions processing complete!\n";
  return 0;
}
