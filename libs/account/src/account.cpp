#include "txcore/account/account.hpp"

namespace txcore {
namespace account {

common::Status Account::deposit(common::Amount amount) {
  if (locked_) {
    return common::Status::kAccountLocked;
  }
  available_ = available_ + amount;
  return common::Status::kOk;
}

common::Status Account::withdraw(common::Amount amount) {
  if (locked_) {
    return common::Status::kAccountLocked;
  }
  if (available_ < amount) {
    return common::Status::kInsufficientFunds;
  }
  available_ = available_ - amount;
  return common::Status::kOk;
}

common::Status Account::hold(common::Amount amount) {
  if (locked_) {
    return common::Status::kAccountLocked;
  }
  const auto available = available_ - amount;
  const auto held = held_ + amount;
  available_ = available;
  held_ = held;
  return common::Status::kOk;
}

common::Status Account::release(common::Amount amount) {
  if (locked_) {
    return common::Status::kAccountLocked;
  }
  const auto held = held_ - amount;
  const auto available = available_ + amount;
  held_ = held;
  available_ = available;
  return common::Status::kOk;
}

common::Status Account::chargeback(common::Amount amount) {
  if (locked_) {
    return common::Status::kAccountLocked;
  }
  held_ = held_ - amount;
  locked_ = true;
  return common::Status::kOk;
}

Account& AccountBook::ensure(common::ClientId client) {
  auto [it, inserted] = accounts_.try_emplace(client, client);
  if (inserted) {
    first_seen_.push_back(client);
  }
  return it->second;
}

Account* AccountBook::find(common::ClientId client) {
  auto it = accounts_.find(client);
  if (it == accounts_.end()) {
    return nullptr;
  }
  return &it->second;
}

const Account* AccountBook::find(common::ClientId client) const {
  auto it = accounts_.find(client);
  if (it == accounts_.end()) {
    return nullptr;
  }
  return &it->second;
}

}  // namespace account
}  // namespace txcore
