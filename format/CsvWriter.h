#ifndef PAYPROC_CSV_WRITER_H
#define PAYPROC_CSV_WRITER_H

#include "../ledger/Account.h"
#include "../lib/Utilities.h"

#include <ostream>
#include <vector>

namespace payproc {

/**
 * CsvWriter - Writes account snapshots as comma separated text.
 *
 *   client,available,held,total,locked
 *   1,51.0,0.0,51.0,false
 */
class CsvWriter {
public:
  explicit CsvWriter(std::ostream &output);

  Roe<void> write(const std::vector<Account> &accounts);

private:
  std::ostream &output_;
};

} // namespace payproc

#endif // PAYPROC_CSV_WRITER_H
