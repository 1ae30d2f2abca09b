#pragma once

namespace payledger::tests {

void test_config_defaults();
void test_config_overrides();
void test_config_validation();

}  // namespace payledger::tests
