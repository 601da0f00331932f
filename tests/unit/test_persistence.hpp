#pragma once

namespace lendcore::tests {

void test_event_codec();
void test_wal_sequences_and_corruption();
void test_wal_torn_tail();
void test_journal_failure_halts_gateway();
void test_snapshot_store();
void test_recovery_rebuilds_ledger();

}  // namespace lendcore::tests
