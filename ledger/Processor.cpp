#include "Processor.h"

#include <map>
#include <utility>

namespace payproc {

VectorSource::VectorSource(std::vector<Roe<AccountActivity>> records)
    : records_(std::move(records)) {}

VectorSource::VectorSource(const std::vector<AccountActivity> &activities) {
  records_.reserve(activities.size());
  for (const auto &activity : activities) {
    records_.emplace_back(activity);
  }
}

std::optional<Roe<AccountActivity>> VectorSource::next() {
  if (position_ >= records_.size()) {
    return std::nullopt;
  }
  return records_[position_++];
}

Processor::Processor() : Module("processor") {}

Processor::Report Processor::process(ActivitySource &source) {
  Report report;
  std::map<ClientId, Account> accounts;

  while (auto record = source.next()) {
    uint64_t index = report.recordCount++;

    if (record->isError()) {
      const auto &err = record->error();
      log().error << "Skipping record " << index
                  << ": error parsing account activity: " << err.message;
      SkippedRecord skipped;
      skipped.index = index;
      skipped.parseFailure = true;
      skipped.code = err.code;
      skipped.message = err.message;
      report.skipped.push_back(std::move(skipped));
      continue;
    }

    const AccountActivity &activity = record->value();
    auto it = accounts.try_emplace(activity.getClientId(), activity.getClientId())
                  .first;

    auto result = it->second.apply(activity);
    if (!result) {
      const auto &err = result.error();
      log().warning << "Error processing account activity " << activity
                    << ": " << Account::errorKind(err.code) << ": "
                    << err.message;
      SkippedRecord skipped;
      skipped.index = index;
      skipped.kind = activity.getKind();
      skipped.transactionId = activity.getTransactionId();
      skipped.clientId = activity.getClientId();
      skipped.code = err.code;
      skipped.message = err.message;
      report.skipped.push_back(std::move(skipped));
      continue;
    }

    ++report.appliedCount;
    log().debug << "Applied " << activity;
  }

  report.accounts.reserve(accounts.size());
  for (auto &entry : accounts) {
    report.accounts.push_back(std::move(entry.second));
  }

  log().info << "Processed " << report.recordCount << " records: "
             << report.appliedCount << " applied, " << report.skipped.size()
             << " skipped, " << report.accounts.size() << " accounts";
  return report;
}

} // namespace payproc
