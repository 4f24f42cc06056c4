#ifndef PAYPROC_JSON_WRITER_H
#define PAYPROC_JSON_WRITER_H

#include "../ledger/Account.h"
#include "../lib/Utilities.h"

#include <nlohmann/json.hpp>

#include <ostream>
#include <vector>

namespace payproc {

/**
 * JsonWriter - Writes account snapshots as a JSON array.
 *
 * Amounts are emitted as decimal strings so that no precision is lost:
 *   [{"client":1,"available":"51.0","held":"0.0","total":"51.0","locked":false}]
 */
class JsonWriter {
public:
  explicit JsonWriter(std::ostream &output, int indent = -1);

  static nlohmann::ordered_json toJson(const Account &account);

  Roe<void> write(const std::vector<Account> &accounts);

private:
  std::ostream &output_;
  int indent_;
};

} // namespace payproc

#endif // PAYPROC_JSON_WRITER_H
