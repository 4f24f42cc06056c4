#ifndef PAYPROC_PROCESSOR_H
#define PAYPROC_PROCESSOR_H

#include "../lib/Module.h"
#include "../lib/Utilities.h"
#include "Account.h"
#include "AccountActivity.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace payproc {

/**
 * ActivitySource - Pull-based producer of parsed activity records.
 *
 * Each call to next() yields one record: either a parsed activity or the
 * parse failure for that record. An empty optional marks the end of input.
 */
class ActivitySource {
public:
  virtual ~ActivitySource() = default;
  virtual std::optional<Roe<AccountActivity>> next() = 0;
};

// Serves records from memory, in order.
class VectorSource : public ActivitySource {
public:
  explicit VectorSource(std::vector<Roe<AccountActivity>> records);
  explicit VectorSource(const std::vector<AccountActivity> &activities);

  std::optional<Roe<AccountActivity>> next() override;

private:
  std::vector<Roe<AccountActivity>> records_;
  size_t position_{0};
};

/**
 * Processor - Folds a stream of activity records into per-client accounts.
 *
 * Accounts are created on the first record naming a client. Parse failures
 * and rejected activities are reported and skipped; neither stops the run.
 * Activities of one client are applied in input order.
 */
class Processor : public Module {
public:
  struct SkippedRecord {
    // Zero-based position in the input sequence
    uint64_t index{0};
    bool parseFailure{false};
    // Activity details; empty kind and zero ids for parse failures
    std::string kind;
    TransactionId transactionId{0};
    ClientId clientId{0};
    int32_t code{0};
    std::string message;
  };

  struct Report {
    // One entry per client seen, ordered by client id
    std::vector<Account> accounts;
    std::vector<SkippedRecord> skipped;
    uint64_t recordCount{0};
    uint64_t appliedCount{0};
  };

  Processor();
  ~Processor() override = default;

  /**
   * Consume the source to exhaustion. Every call starts from an empty set
   * of accounts.
   */
  Report process(ActivitySource &source);
};

} // namespace payproc

#endif // PAYPROC_PROCESSOR_H
