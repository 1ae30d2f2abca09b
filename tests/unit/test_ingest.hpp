#pragma once

namespace payledger::tests {

void test_split_fields();
void test_parse_record();
void test_transaction_reader();
void test_transaction_reader_missing_file();

}  // namespace payledger::tests
