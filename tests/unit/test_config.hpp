#pragma once

namespace lendcore::tests {

void test_config_defaults();
void test_config_amounts();
void test_config_validation();
void test_config_integer_ranges();
void test_config_parse_errors();

}  // namespace lendcore::tests
