#pragma once

#include <unordered_map>
#include <vector>

#include "txcore/common/amount.hpp"
#include "txcore/common/status.hpp"
#include "txcore/common/types.hpp"

namespace txcore {
namespace account {

// Per-client balances. Every transition either applies fully or returns a
// non-ok status and leaves the account untouched. total() is derived.
class Account {
 public:
  explicit Account(common::ClientId client) noexcept : client_(client) {}

  [[nodiscard]] common::Status deposit(common::Amount amount);
  [[nodiscard]] common::Status withdraw(common::Amount amount);

  // Moves a disputed amount from available to held. available may go negative
  // when funds were withdrawn after the disputed deposit.
  [[nodiscard]] common::Status hold(common::Amount amount);
  [[nodiscard]] common::Status release(common::Amount amount);
  // Removes held funds and locks the account permanently.
  [[nodiscard]] common::Status chargeback(common::Amount amount);

  [[nodiscard]] common::ClientId client() const noexcept { return client_; }
  [[nodiscard]] common::Amount available() const noexcept { return available_; }
  [[nodiscard]] common::Amount held() const noexcept { return held_; }
  [[nodiscard]] common::Amount total() const { return available_ + held_; }
  [[nodiscard]] bool locked() const noexcept { return locked_; }

 private:
  common::ClientId client_{0};
  common::Amount available_{};
  common::Amount held_{};
  bool locked_{false};
};

// Owns every account of a run. Accounts are never removed and are remembered
// in the order they were first created.
class AccountBook {
 public:
  Account& ensure(common::ClientId client);
  [[nodiscard]] Account* find(common::ClientId client);
  [[nodiscard]] const Account* find(common::ClientId client) const;

  [[nodiscard]] std::size_t size() const noexcept { return accounts_.size(); }
  [[nodiscard]] bool empty() const noexcept { return accounts_.empty(); }
  [[nodiscard]] const std::vector<common::ClientId>& first_seen_order() const noexcept { return first_seen_; }

 private:
  std::unordered_map<common::ClientId, Account> accounts_{};
  std::vector<common::ClientId> first_seen_{};
};

}  // namespace account
}  // namespace txcore
