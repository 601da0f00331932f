#pragma once

namespace lendcore::tests {

void test_amount_units();
void test_ledger_deposit_and_borrow();
void test_ledger_invalid_amounts();
void test_ledger_unsafe_withdraw();
void test_ledger_debt_free_withdraw();
void test_ledger_repay();
void test_ledger_collaborator_failures();
void test_ledger_journal_refusal();
void test_ledger_rejects_bad_params();
void test_ledger_borrow_limits();
void test_ledger_oracle_and_overflow();
void test_ledger_read_idempotence();

}  // namespace lendcore::tests
