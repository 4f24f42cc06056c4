#ifndef PAYPROC_ACCOUNT_ACTIVITY_H
#define PAYPROC_ACCOUNT_ACTIVITY_H

#include "Amount.h"
#include "Types.h"

#include <ostream>
#include <string>
#include <variant>

namespace payproc {

// A deposit or withdrawal of funds.
struct Transaction {
  TransactionId id{0};
  ClientId clientId{0};
  Amount amount;

  bool operator==(const Transaction &other) const {
    return id == other.id && clientId == other.clientId &&
           amount == other.amount;
  }
};

// Reference to an earlier transaction; the amount is looked up when applied.
struct DisputeCase {
  TransactionId transactionId{0};
  ClientId clientId{0};

  bool operator==(const DisputeCase &other) const {
    return transactionId == other.transactionId && clientId == other.clientId;
  }
};

/**
 * AccountActivity - One record of the input stream.
 *
 * A closed set of five kinds. Consumers dispatch with std::visit so that a
 * missing kind is a compile error.
 */
class AccountActivity {
public:
  struct Deposit {
    Transaction transaction;
    bool operator==(const Deposit &o) const { return transaction == o.transaction; }
  };
  struct Withdrawal {
    Transaction transaction;
    bool operator==(const Withdrawal &o) const { return transaction == o.transaction; }
  };
  struct Dispute {
    DisputeCase disputeCase;
    bool operator==(const Dispute &o) const { return disputeCase == o.disputeCase; }
  };
  struct Resolve {
    DisputeCase disputeCase;
    bool operator==(const Resolve &o) const { return disputeCase == o.disputeCase; }
  };
  struct Chargeback {
    DisputeCase disputeCase;
    bool operator==(const Chargeback &o) const { return disputeCase == o.disputeCase; }
  };

  using Variant =
      std::variant<Deposit, Withdrawal, Dispute, Resolve, Chargeback>;

  static AccountActivity deposit(TransactionId id, ClientId clientId,
                                 const Amount &amount);
  static AccountActivity withdrawal(TransactionId id, ClientId clientId,
                                    const Amount &amount);
  static AccountActivity dispute(TransactionId id, ClientId clientId);
  static AccountActivity resolve(TransactionId id, ClientId clientId);
  static AccountActivity chargeback(TransactionId id, ClientId clientId);

  explicit AccountActivity(Variant variant);

  ClientId getClientId() const;
  TransactionId getTransactionId() const;

  // Lower-case kind name as used in the input format: "deposit", ...
  const char *getKind() const;

  const Variant &getVariant() const { return variant_; }

  bool operator==(const AccountActivity &other) const {
    return variant_ == other.variant_;
  }
  bool operator!=(const AccountActivity &other) const {
    return !(*this == other);
  }

private:
  Variant variant_;
};

// "deposit tx=1 client=2 amount=10.0"
std::ostream &operator<<(std::ostream &os, const AccountActivity &activity);

} // namespace payproc

#endif // PAYPROC_ACCOUNT_ACTIVITY_H
