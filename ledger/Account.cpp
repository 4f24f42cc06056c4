#include "Account.h"

namespace payproc {

// Routes each activity kind to its handler; std::visit fails to compile if a
// kind has no overload here.
struct Account::Dispatcher {
  Account &account;

  Roe<void> operator()(const AccountActivity::Deposit &a) const {
    return account.deposit(a.transaction);
  }
  Roe<void> operator()(const AccountActivity::Withdrawal &a) const {
    return account.withdraw(a.transaction);
  }
  Roe<void> operator()(const AccountActivity::Dispute &a) const {
    return account.initiateDispute(a.disputeCase);
  }
  Roe<void> operator()(const AccountActivity::Resolve &a) const {
    return account.resolveDispute(a.disputeCase);
  }
  Roe<void> operator()(const AccountActivity::Chargeback &a) const {
    return account.issueChargeback(a.disputeCase);
  }
};

std::string Account::errorKind(int32_t code) {
  switch (code) {
  case E_INVALID_TRANSACTION:
    return "invalid transaction";
  case E_FAILED_TRANSACTION:
    return "failed transaction";
  case E_FAILED_DISPUTE_CASE:
    return "failed dispute case";
  default:
    return "unknown error";
  }
}

Account::Account(ClientId clientId) : clientId_(clientId) {}

bool Account::hasTransaction(TransactionId id) const {
  return mTransactions_.find(id) != mTransactions_.end();
}

bool Account::isDisputed(TransactionId id) const {
  return disputes_.find(id) != disputes_.end();
}

Account::Roe<void> Account::apply(const AccountActivity &activity) {
  if (locked_) {
    return Error(E_FAILED_TRANSACTION, "account locked");
  }
  return std::visit(Dispatcher{*this}, activity.getVariant());
}

// Amount validity is checked before the duplicate id, so a negative amount
// on a reused id reports an invalid transaction.
Account::Roe<void> Account::checkTransaction(const Transaction &transaction,
                                             const char *kind) const {
  if (transaction.amount.isNegative()) {
    return Error(E_INVALID_TRANSACTION,
                 std::string(kind) + " amount must not be negative");
  }
  if (hasTransaction(transaction.id)) {
    return Error(E_FAILED_TRANSACTION, "transaction already recorded");
  }
  return {};
}

Account::Roe<void> Account::deposit(const Transaction &transaction) {
  auto check = checkTransaction(transaction, "deposit");
  if (!check) {
    return check;
  }

  const Amount &amount = transaction.amount;
  if (!available_.canAdd(amount) || !total_.canAdd(amount)) {
    return Error(E_FAILED_TRANSACTION, "deposit would cause balance overflow");
  }

  available_ += amount;
  total_ += amount;
  mTransactions_.emplace(transaction.id, amount);
  return {};
}

Account::Roe<void> Account::withdraw(const Transaction &transaction) {
  auto check = checkTransaction(transaction, "withdrawal");
  if (!check) {
    return check;
  }

  const Amount &amount = transaction.amount;
  if (amount > available_) {
    return Error(E_FAILED_TRANSACTION, "insufficient funds");
  }

  available_ -= amount;
  total_ -= amount;
  mTransactions_.emplace(transaction.id, amount);
  return {};
}

Account::Roe<void> Account::initiateDispute(const DisputeCase &disputeCase) {
  if (isDisputed(disputeCase.transactionId)) {
    return Error(E_FAILED_DISPUTE_CASE, "transaction already disputed");
  }

  auto it = mTransactions_.find(disputeCase.transactionId);
  if (it == mTransactions_.end()) {
    // May refer to a transaction outside the observed input
    return {};
  }

  const Amount &amount = it->second;
  if (!available_.canSubtract(amount) || !held_.canAdd(amount)) {
    return Error(E_FAILED_DISPUTE_CASE, "dispute would cause balance overflow");
  }

  available_ -= amount;
  held_ += amount;
  disputes_.insert(disputeCase.transactionId);
  return {};
}

Account::Roe<void> Account::resolveDispute(const DisputeCase &disputeCase) {
  if (!isDisputed(disputeCase.transactionId)) {
    return {};
  }

  const Amount &amount = mTransactions_.at(disputeCase.transactionId);
  held_ -= amount;
  available_ += amount;
  disputes_.erase(disputeCase.transactionId);
  return {};
}

Account::Roe<void> Account::issueChargeback(const DisputeCase &disputeCase) {
  if (!isDisputed(disputeCase.transactionId)) {
    return {};
  }

  const Amount &amount = mTransactions_.at(disputeCase.transactionId);
  held_ -= amount;
  total_ -= amount;
  disputes_.erase(disputeCase.transactionId);
  locked_ = true;
  return {};
}

} // namespace payproc
