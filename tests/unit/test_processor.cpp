#include "test_processor.hpp"

#include <cassert>
#include <optional>
#include <string_view>
#include <vector>
#include "txcore/processor/processor.hpp"

namespace txcore::tests {

namespace {

using common::RecordKind;
using common::Status;

common::Amount amt(std::string_view text) {
  const auto amount = common::Amount::from_decimal_text(text);
  assert(amount.has_value());
  return *amount;
}

common::TransactionRecord deposit(common::ClientId client, common::TxId tx, std::string_view amount) {
  return {.kind = RecordKind::kDeposit, .client = client, .tx = tx, .amount = amt(amount)};
}

common::TransactionRecord withdrawal(common::ClientId client, common::TxId tx, std::string_view amount) {
  return {.kind = RecordKind::kWithdrawal, .client = client, .tx = tx, .amount = amt(amount)};
}

common::TransactionRecord dispute(common::ClientId client, common::TxId tx) {
  return {.kind = RecordKind::kDispute, .client = client, .tx = tx};
}

common::TransactionRecord resolve(common::ClientId client, common::TxId tx) {
  return {.kind = RecordKind::kResolve, .client = client, .tx = tx};
}

common::TransactionRecord chargeback(common::ClientId client, common::TxId tx) {
  return {.kind = RecordKind::kChargeback, .client = client, .tx = tx};
}

void expect_account(const processor::Processor& processor, common::ClientId client, std::string_view available,
                    std::string_view held, std::string_view total, bool locked) {
  const auto account = processor.account(client);
  assert(account.has_value());
  assert(account->available == amt(available));
  assert(account->held == amt(held));
  assert(account->total == amt(total));
  assert(account->locked == locked);
}

}  // namespace

void test_processor_scenario_deposits_and_withdrawals() {
  processor::Processor processor{processor::Store{}};
  assert(processor.apply(deposit(1, 1, "1.0")) == Status::kOk);
  assert(processor.apply(deposit(2, 2, "2.0")) == Status::kOk);
  assert(processor.apply(deposit(1, 3, "2.0")) == Status::kOk);
  assert(processor.apply(withdrawal(1, 4, "1.5")) == Status::kOk);
  assert(processor.apply(withdrawal(2, 5, "3.0")) == Status::kInsufficientFunds);

  expect_account(processor, 1, "1.5", "0", "1.5", false);
  expect_account(processor, 2, "2.0", "0", "2.0", false);
  assert(processor.account_count() == 2);
}

void test_processor_scenario_dispute_resolve() {
  processor::Processor processor{processor::Store{}};
  assert(processor.apply(deposit(1, 1, "5.0")) == Status::kOk);
  assert(processor.apply(dispute(1, 1)) == Status::kOk);
  expect_account(processor, 1, "0", "5.0", "5.0", false);
  assert(processor.apply(resolve(1, 1)) == Status::kOk);
  expect_account(processor, 1, "5.0", "0", "5.0", false);
}

void test_processor_scenario_chargeback_locks() {
  processor::Processor processor{processor::Store{}};
  assert(processor.apply(deposit(1, 1, "5.0")) == Status::kOk);
  assert(processor.apply(dispute(1, 1)) == Status::kOk);
  assert(processor.apply(chargeback(1, 1)) == Status::kOk);
  assert(processor.apply(deposit(1, 2, "10.0")) == Status::kAccountLocked);
  expect_account(processor, 1, "0", "0", "0", true);
}

void test_processor_scenario_unknown_dispute() {
  processor::Processor processor{processor::Store{}};
  assert(processor.apply(dispute(1, 99)) == Status::kUnknownTransaction);
  assert(!processor.account(1).has_value());

  assert(processor.apply(deposit(1, 1, "3.0")) == Status::kOk);
  assert(processor.apply(dispute(1, 99)) == Status::kUnknownTransaction);
  assert(processor.apply(resolve(1, 99)) == Status::kUnknownTransaction);
  assert(processor.apply(chargeback(1, 99)) == Status::kUnknownTransaction);
  expect_account(processor, 1, "3.0", "0", "3.0", false);
}

void test_processor_deposit_and_withdrawal_rejections() {
  processor::Processor processor{processor::Store{}};

  // A rejected first deposit creates no account.
  assert(processor.apply(deposit(1, 1, "-10.0")) == Status::kInvalidAmount);
  assert(processor.apply(deposit(1, 1, "0")) == Status::kInvalidAmount);
  assert(processor.apply({.kind = RecordKind::kDeposit, .client = 1, .tx = 1}) == Status::kInvalidAmount);
  assert(processor.account_count() == 0);

  assert(processor.apply(withdrawal(4, 10, "1.0")) == Status::kUnknownClient);

  assert(processor.apply(deposit(1, 1, "10.0")) == Status::kOk);
  assert(processor.apply(deposit(1, 1, "10.0")) == Status::kDuplicateTransactionId);
  assert(processor.apply(deposit(2, 1, "10.0")) == Status::kDuplicateTransactionId);
  assert(!processor.account(2).has_value());

  assert(processor.apply({.kind = RecordKind::kWithdrawal, .client = 1, .tx = 2}) == Status::kInvalidAmount);
  assert(processor.apply(withdrawal(1, 2, "-1")) == Status::kInvalidAmount);
  assert(processor.apply(withdrawal(1, 2, "10.0001")) == Status::kInsufficientFunds);
  assert(processor.apply(withdrawal(1, 2, "4.0")) == Status::kOk);
  assert(processor.apply(withdrawal(1, 2, "1.0")) == Status::kDuplicateTransactionId);
  assert(processor.apply(withdrawal(1, 1, "1.0")) == Status::kDuplicateTransactionId);
  assert(processor.apply(deposit(1, 2, "1.0")) == Status::kDuplicateTransactionId);

  expect_account(processor, 1, "6.0", "0", "6.0", false);
}

void test_processor_dispute_rejections() {
  processor::Processor processor{processor::Store{}};
  assert(processor.apply(deposit(1, 1, "10.0")) == Status::kOk);
  assert(processor.apply(deposit(2, 2, "4.0")) == Status::kOk);
  assert(processor.apply(withdrawal(1, 3, "2.0")) == Status::kOk);

  assert(processor.apply(dispute(2, 1)) == Status::kClientMismatch);
  assert(processor.apply(dispute(1, 3)) == Status::kUnknownTransaction);
  assert(processor.apply(resolve(1, 1)) == Status::kInvalidStateTransition);
  assert(processor.apply(chargeback(1, 1)) == Status::kInvalidStateTransition);
  expect_account(processor, 1, "8.0", "0", "8.0", false);

  assert(processor.apply(dispute(1, 1)) == Status::kOk);
  expect_account(processor, 1, "-2.0", "10.0", "8.0", false);

  // Replayed disputes never apply twice, whatever the entry's state.
  assert(processor.apply(dispute(1, 1)) == Status::kInvalidStateTransition);
  expect_account(processor, 1, "-2.0", "10.0", "8.0", false);
  assert(processor.apply(resolve(2, 1)) == Status::kClientMismatch);
  assert(processor.apply(resolve(1, 1)) == Status::kOk);
  assert(processor.apply(dispute(1, 1)) == Status::kInvalidStateTransition);
  assert(processor.apply(resolve(1, 1)) == Status::kInvalidStateTransition);
  assert(processor.apply(chargeback(1, 1)) == Status::kInvalidStateTransition);
  expect_account(processor, 1, "8.0", "0", "8.0", false);

  assert(processor.apply(dispute(2, 2)) == Status::kOk);
  assert(processor.apply(chargeback(2, 2)) == Status::kOk);
  assert(processor.apply(dispute(2, 2)) == Status::kAccountLocked);
  expect_account(processor, 2, "0", "0", "0", true);
}

void test_processor_locked_account_is_frozen() {
  processor::Processor processor{processor::Store{}};
  assert(processor.apply(deposit(1, 1, "5.0")) == Status::kOk);
  assert(processor.apply(deposit(1, 2, "7.0")) == Status::kOk);
  assert(processor.apply(deposit(1, 3, "1.0")) == Status::kOk);
  assert(processor.apply(dispute(1, 2)) == Status::kOk);
  assert(processor.apply(dispute(1, 1)) == Status::kOk);
  assert(processor.apply(chargeback(1, 1)) == Status::kOk);
  expect_account(processor, 1, "1.0", "7.0", "8.0", true);

  const std::vector<common::TransactionRecord> after_lock{
      deposit(1, 10, "3.0"), withdrawal(1, 11, "0.5"), dispute(1, 3), resolve(1, 2), chargeback(1, 2),
  };
  for (const auto& record : after_lock) {
    assert(processor.apply(record) == Status::kAccountLocked);
    expect_account(processor, 1, "1.0", "7.0", "8.0", true);
  }

  // Other clients are unaffected.
  assert(processor.apply(deposit(2, 12, "1.0")) == Status::kOk);
  expect_account(processor, 2, "1.0", "0", "1.0", false);
}

void test_processor_conservation_and_invariants() {
  processor::Processor processor{processor::Store{}};
  const std::vector<common::TransactionRecord> records{
      deposit(1, 1, "10.1234"), withdrawal(1, 2, "3.0001"), withdrawal(1, 3, "50"), deposit(1, 4, "0.0001"),
      deposit(1, 4, "99"),      withdrawal(1, 5, "7.1234"), withdrawal(1, 6, "0.0001"), deposit(1, 7, "-5"),
  };

  common::Amount expected{};
  for (const auto& record : records) {
    const auto status = processor.apply(record);
    if (status == Status::kOk) {
      expected = record.kind == RecordKind::kDeposit ? expected + *record.amount : expected - *record.amount;
    }
    const auto account = processor.account(1);
    assert(account->total == account->available + account->held);
  }
  expect_account(processor, 1, "0", "0", "0", false);
  assert(processor.account(1)->available == expected);

  processor::Processor mixed{processor::Store{}};
  const std::vector<common::TransactionRecord> mixed_records{
      deposit(1, 1, "10"), deposit(2, 2, "5"), withdrawal(1, 3, "8"), dispute(1, 1), resolve(1, 1),
      dispute(2, 2),       withdrawal(2, 4, "1"), chargeback(2, 2), deposit(2, 5, "1"), dispute(1, 1),
  };
  for (const auto& record : mixed_records) {
    (void)mixed.apply(record);
    for (const auto& account : mixed.snapshot()) {
      assert(account.total == account.available + account.held);
    }
  }
  expect_account(mixed, 1, "2", "0", "2", false);
  expect_account(mixed, 2, "0", "0", "0", true);
}

void test_processor_chargeback_after_withdrawal() {
  processor::Processor processor{processor::Store{}};
  assert(processor.apply(deposit(1, 1, "10")) == Status::kOk);
  assert(processor.apply(withdrawal(1, 2, "10")) == Status::kOk);

  // The hold takes the full deposit even though nothing is available.
  assert(processor.apply(dispute(1, 1)) == Status::kOk);
  expect_account(processor, 1, "-10", "10", "0", false);

  assert(processor.apply(chargeback(1, 1)) == Status::kOk);
  expect_account(processor, 1, "-10", "0", "-10", true);
  assert(processor.account(1)->total.is_negative());
  assert(processor.apply(deposit(1, 3, "10")) == Status::kAccountLocked);

  // Resolving instead restores the pre-dispute balances.
  processor::Processor resolved{processor::Store{}};
  assert(resolved.apply(deposit(1, 1, "10")) == Status::kOk);
  assert(resolved.apply(withdrawal(1, 2, "4")) == Status::kOk);
  assert(resolved.apply(dispute(1, 1)) == Status::kOk);
  expect_account(resolved, 1, "-4", "10", "6", false);
  assert(resolved.apply(resolve(1, 1)) == Status::kOk);
  expect_account(resolved, 1, "6", "0", "6", false);
}

void test_processor_snapshot_order() {
  processor::Processor processor{processor::Store{}};
  assert(processor.apply(deposit(9, 1, "1")) == Status::kOk);
  assert(processor.apply(deposit(3, 2, "1")) == Status::kOk);
  assert(processor.apply(deposit(5, 3, "1")) == Status::kOk);
  assert(processor.apply(deposit(3, 4, "1")) == Status::kOk);

  const auto first_seen = processor.snapshot();
  assert(first_seen.size() == 3);
  assert(first_seen[0].client == 9);
  assert(first_seen[1].client == 3);
  assert(first_seen[2].client == 5);
  assert(first_seen[1].available == amt("2"));

  const auto by_client = processor.snapshot(processor::SnapshotOrder::kClientId);
  assert(by_client.size() == 3);
  assert(by_client[0].client == 3);
  assert(by_client[1].client == 5);
  assert(by_client[2].client == 9);

  // Independent stores do not share state.
  processor::Processor other{processor::Store{}};
  assert(other.snapshot().empty());
  assert(other.apply(deposit(9, 1, "1")) == Status::kOk);
}

}  // namespace txcore::tests
