#include "CsvReader.h"

namespace payproc {

CsvReader::CsvReader(std::istream &input) : input_(input) {}

// Quoted fields may not contain the delimiter; "" inside quotes is a quote.
static std::string unquote(const std::string &field) {
  if (field.size() < 2 || field.front() != '"' || field.back() != '"') {
    return field;
  }
  std::string result;
  for (size_t i = 1; i + 1 < field.size(); ++i) {
    result += field[i];
    if (field[i] == '"' && field[i + 1] == '"' && i + 2 < field.size()) {
      ++i;
    }
  }
  return utl::trim(result);
}

static std::vector<std::string> splitFields(const std::string &line) {
  auto fields = utl::split(line, ',');
  for (auto &field : fields) {
    field = unquote(utl::trim(field));
  }
  return fields;
}

static void stripByteOrderMark(std::string &line) {
  static const std::string bom = "\xEF\xBB\xBF";
  if (line.compare(0, bom.size(), bom) == 0) {
    line.erase(0, bom.size());
  }
}

Roe<void> CsvReader::readHeader() {
  headerRead_ = true;

  std::string line;
  while (std::getline(input_, line)) {
    ++lineNumber_;
    if (lineNumber_ == 1) {
      stripByteOrderMark(line);
    }
    if (utl::trim(line).empty()) {
      continue;
    }

    auto names = splitFields(line);
    headerSize_ = names.size();
    for (size_t i = 0; i < names.size(); ++i) {
      std::string name = utl::toLower(names[i]);
      int *column = nullptr;
      if (name == "type") {
        column = &typeColumn_;
      } else if (name == "client") {
        column = &clientColumn_;
      } else if (name == "tx") {
        column = &txColumn_;
      } else if (name == "amount") {
        column = &amountColumn_;
      } else {
        continue;
      }
      if (*column >= 0) {
        exhausted_ = true;
        return Error(E_HEADER, "invalid format: duplicate column '" + name +
                                   "' in header");
      }
      *column = static_cast<int>(i);
    }

    if (typeColumn_ < 0 || clientColumn_ < 0 || txColumn_ < 0) {
      exhausted_ = true;
      return Error(E_HEADER, "invalid format: header must name the columns "
                             "type, client and tx");
    }
    return {};
  }

  exhausted_ = true;
  if (input_.bad()) {
    return Error(E_IO, "failed to read header line");
  }
  return {};
}

std::optional<Roe<AccountActivity>> CsvReader::next() {
  if (!headerRead_) {
    auto header = readHeader();
    if (!header) {
      return Roe<AccountActivity>(header.error());
    }
  }
  if (exhausted_) {
    return std::nullopt;
  }

  std::string line;
  while (std::getline(input_, line)) {
    ++lineNumber_;
    if (utl::trim(line).empty()) {
      continue;
    }
    return parseRecord(splitFields(line));
  }

  exhausted_ = true;
  if (input_.bad()) {
    return Roe<AccountActivity>(
        Error(E_IO, "failed to read line " + std::to_string(lineNumber_ + 1)));
  }
  return std::nullopt;
}

std::string CsvReader::field(const std::vector<std::string> &fields,
                             int column) const {
  if (column < 0 || static_cast<size_t>(column) >= fields.size()) {
    return "";
  }
  return fields[column];
}

Error CsvReader::recordError(const std::string &message) const {
  return Error(E_RECORD, "line " + std::to_string(lineNumber_) + ": " + message);
}

Roe<AccountActivity>
CsvReader::parseRecord(const std::vector<std::string> &fields) const {
  if (fields.size() > headerSize_) {
    return recordError("found " + std::to_string(fields.size()) +
                       " fields, header has " + std::to_string(headerSize_));
  }

  std::string type = utl::toLower(field(fields, typeColumn_));
  std::string clientText = field(fields, clientColumn_);
  std::string txText = field(fields, txColumn_);

  ClientId clientId = 0;
  if (!utl::parseUInt16(clientText, clientId)) {
    return recordError("invalid client id '" + clientText + "'");
  }
  TransactionId transactionId = 0;
  if (!utl::parseUInt32(txText, transactionId)) {
    return recordError("invalid transaction id '" + txText + "'");
  }

  if (type == "deposit" || type == "withdrawal") {
    std::string amountText = field(fields, amountColumn_);
    if (amountText.empty()) {
      return recordError(type + " requires an amount");
    }
    auto amount = Amount::parse(amountText);
    if (!amount) {
      return recordError(amount.error().message);
    }
    if (type == "deposit") {
      return AccountActivity::deposit(transactionId, clientId, *amount);
    }
    return AccountActivity::withdrawal(transactionId, clientId, *amount);
  }
  if (type == "dispute") {
    return AccountActivity::dispute(transactionId, clientId);
  }
  if (type == "resolve") {
    return AccountActivity::resolve(transactionId, clientId);
  }
  if (type == "chargeback") {
    return AccountActivity::chargeback(transactionId, clientId);
  }
  return recordError("unknown activity type '" + type +
                     "', expected one of deposit, withdrawal, dispute, "
                     "resolve, chargeback");
}

} // namespace payproc
