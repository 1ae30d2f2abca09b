// Unit test runner - calls test functions from per-component test files

#include "test_account.hpp"
#include "test_amount.hpp"
#include "test_config.hpp"
#include "test_engine.hpp"
#include "test_ingest.hpp"
#include "test_report.hpp"

int main() {
  using namespace payledger::tests;

  // Amount tests
  test_amount_parse();
  test_amount_format();

  // Account tests
  test_account_deposit_withdraw();
  test_account_insufficient_funds();
  test_account_dispute_resolve();
  test_account_missing_or_undisputed();
  test_account_charge_back_locks();
  test_account_redispute_policy();
  test_account_withdraw_policy();
  test_account_process_transaction();
  test_account_balance_overflow();
  test_account_reused_disputed_id();

  // Engine tests
  test_engine_deposit_withdraw_scenario();
  test_engine_charge_back_scenario();
  test_engine_unrecognized_type();
  test_engine_invalid_amount();
  test_engine_parse_failures();
  test_engine_balance_invariant();
  test_engine_reader_end_to_end();
  test_engine_balance_overflow();
  test_engine_locked_account_first();

  // Ingest tests
  test_split_fields();
  test_parse_record();
  test_transaction_reader();
  test_transaction_reader_missing_file();

  // Report tests
  test_report_rows();
  test_report_files();
  test_report_extra_fields();

  // Config tests
  test_config_defaults();
  test_config_overrides();
  test_config_validation();

  return 0;
}
