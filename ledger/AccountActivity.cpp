#include "AccountActivity.h"

#include <utility>

namespace payproc {

namespace {

using Ids = std::pair<TransactionId, ClientId>;

struct IdsOf {
  Ids operator()(const AccountActivity::Deposit &a) const {
    return {a.transaction.id, a.transaction.clientId};
  }
  Ids operator()(const AccountActivity::Withdrawal &a) const {
    return {a.transaction.id, a.transaction.clientId};
  }
  Ids operator()(const AccountActivity::Dispute &a) const {
    return {a.disputeCase.transactionId, a.disputeCase.clientId};
  }
  Ids operator()(const AccountActivity::Resolve &a) const {
    return {a.disputeCase.transactionId, a.disputeCase.clientId};
  }
  Ids operator()(const AccountActivity::Chargeback &a) const {
    return {a.disputeCase.transactionId, a.disputeCase.clientId};
  }
};

struct KindOf {
  const char *operator()(const AccountActivity::Deposit &) const {
    return "deposit";
  }
  const char *operator()(const AccountActivity::Withdrawal &) const {
    return "withdrawal";
  }
  const char *operator()(const AccountActivity::Dispute &) const {
    return "dispute";
  }
  const char *operator()(const AccountActivity::Resolve &) const {
    return "resolve";
  }
  const char *operator()(const AccountActivity::Chargeback &) const {
    return "chargeback";
  }
};

} // namespace

AccountActivity::AccountActivity(Variant variant)
    : variant_(std::move(variant)) {}

AccountActivity AccountActivity::deposit(TransactionId id, ClientId clientId,
                                         const Amount &amount) {
  return AccountActivity(Deposit{Transaction{id, clientId, amount}});
}

AccountActivity AccountActivity::withdrawal(TransactionId id,
                                            ClientId clientId,
                                            const Amount &amount) {
  return AccountActivity(Withdrawal{Transaction{id, clientId, amount}});
}

AccountActivity AccountActivity::dispute(TransactionId id, ClientId clientId) {
  return AccountActivity(Dispute{DisputeCase{id, clientId}});
}

AccountActivity AccountActivity::resolve(TransactionId id, ClientId clientId) {
  return AccountActivity(Resolve{DisputeCase{id, clientId}});
}

AccountActivity AccountActivity::chargeback(TransactionId id,
                                            ClientId clientId) {
  return AccountActivity(Chargeback{DisputeCase{id, clientId}});
}

ClientId AccountActivity::getClientId() const {
  return std::visit(IdsOf{}, variant_).second;
}

TransactionId AccountActivity::getTransactionId() const {
  return std::visit(IdsOf{}, variant_).first;
}

const char *AccountActivity::getKind() const {
  return std::visit(KindOf{}, variant_);
}

std::ostream &operator<<(std::ostream &os, const AccountActivity &activity) {
  os << activity.getKind() << " tx=" << activity.getTransactionId()
     << " client=" << activity.getClientId();
  if (auto deposit =
          std::get_if<AccountActivity::Deposit>(&activity.getVariant())) {
    os << " amount=" << deposit->transaction.amount;
  } else if (auto withdrawal = std::get_if<AccountActivity::Withdrawal>(
                 &activity.getVariant())) {
    os << " amount=" << withdrawal->transaction.amount;
  }
  return os;
}

} // namespace payproc
