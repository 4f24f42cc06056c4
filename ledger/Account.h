#ifndef PAYPROC_ACCOUNT_H
#define PAYPROC_ACCOUNT_H

#include "../lib/ResultOrError.h"
#include "AccountActivity.h"
#include "Amount.h"
#include "Types.h"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace payproc {

/**
 * Account - Balances and dispute bookkeeping of one client.
 *
 * All state changes go through apply(). Invariant at every observation point:
 * total == available + held. A rejected activity leaves the account exactly
 * as it was.
 *
 * Transactions (deposits and withdrawals) are recorded by id, first write
 * wins. Dispute, resolve and chargeback refer to a recorded transaction;
 * references to unknown transactions are accepted as no-ops. A chargeback
 * locks the account, after which every activity is rejected.
 */
class Account {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };
  template <typename T> using Roe = ResultOrError<T, Error>;

  // Payload out of domain (negative amount)
  constexpr static int32_t E_INVALID_TRANSACTION = 1;
  // Well-formed but not executable (funds, duplicate id, locked account)
  constexpr static int32_t E_FAILED_TRANSACTION = 2;
  // Dispute protocol violation (transaction already disputed)
  constexpr static int32_t E_FAILED_DISPUTE_CASE = 3;

  // "invalid transaction", "failed transaction", "failed dispute case"
  static std::string errorKind(int32_t code);

  explicit Account(ClientId clientId);

  Roe<void> apply(const AccountActivity &activity);

  ClientId getClientId() const { return clientId_; }
  const Amount &getAvailable() const { return available_; }
  const Amount &getHeld() const { return held_; }
  const Amount &getTotal() const { return total_; }
  bool isLocked() const { return locked_; }

  bool hasTransaction(TransactionId id) const;
  bool isDisputed(TransactionId id) const;

private:
  struct Dispatcher;

  Roe<void> deposit(const Transaction &transaction);
  Roe<void> withdraw(const Transaction &transaction);
  Roe<void> initiateDispute(const DisputeCase &disputeCase);
  Roe<void> resolveDispute(const DisputeCase &disputeCase);
  Roe<void> issueChargeback(const DisputeCase &disputeCase);

  Roe<void> checkTransaction(const Transaction &transaction,
                             const char *kind) const;

  ClientId clientId_;
  Amount available_;
  Amount held_;
  Amount total_;
  bool locked_{false};
  std::unordered_map<TransactionId, Amount> mTransactions_;
  std::unordered_set<TransactionId> disputes_;
};

} // namespace payproc

#endif // PAYPROC_ACCOUNT_H
