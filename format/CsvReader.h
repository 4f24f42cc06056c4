#ifndef PAYPROC_CSV_READER_H
#define PAYPROC_CSV_READER_H

#include "../ledger/Processor.h"
#include "../lib/Utilities.h"

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace payproc {

/**
 * CsvReader - Reads account activity records from comma separated text.
 *
 * The first non-blank line is the header naming the columns type, client, tx
 * and (optionally) amount in any order. Fields are whitespace-trimmed and
 * blank lines are skipped. A UTF-8 byte order mark before the header is
 * ignored, and surrounding double quotes are removed from fields. A record
 * may have fewer fields than the header;
 * only deposits and withdrawals need the amount.
 *
 *   type,       client, tx, amount
 *   deposit,    1,      1,  100.0
 *   dispute,    1,      1
 */
class CsvReader : public ActivitySource {
public:
  constexpr static int32_t E_HEADER = 1;
  constexpr static int32_t E_IO = 2;
  constexpr static int32_t E_RECORD = 3;

  explicit CsvReader(std::istream &input);
  ~CsvReader() override = default;

  /**
   * Read and validate the header line. Must be called before next().
   * Empty input is not an error; next() then yields nothing.
   */
  Roe<void> readHeader();

  std::optional<Roe<AccountActivity>> next() override;

  uint64_t getLineNumber() const { return lineNumber_; }

private:
  Roe<AccountActivity> parseRecord(const std::vector<std::string> &fields) const;
  std::string field(const std::vector<std::string> &fields, int column) const;
  Error recordError(const std::string &message) const;

  std::istream &input_;
  uint64_t lineNumber_{0};
  bool headerRead_{false};
  bool exhausted_{false};
  int typeColumn_{-1};
  int clientColumn_{-1};
  int txColumn_{-1};
  int amountColumn_{-1};
  size_t headerSize_{0};
};

} // namespace payproc

#endif // PAYPROC_CSV_READER_H
