#include "CsvWriter.h"

namespace payproc {

CsvWriter::CsvWriter(std::ostream &output) : output_(output) {}

Roe<void> CsvWriter::write(const std::vector<Account> &accounts) {
  output_ << "client,available,held,total,locked\n";
  for (const auto &account : accounts) {
    output_ << account.getClientId() << ',' << account.getAvailable() << ','
            << account.getHeld() << ',' << account.getTotal() << ','
            << (account.isLocked() ? "true" : "false") << '\n';
  }
  output_.flush();
  if (!output_) {
    return Error(1, "failed to write account snapshot");
  }
  return {};
}

} // namespace payproc
