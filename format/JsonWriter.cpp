#include "JsonWriter.h"

namespace payproc {

JsonWriter::JsonWriter(std::ostream &output, int indent)
    : output_(output), indent_(indent) {}

nlohmann::ordered_json JsonWriter::toJson(const Account &account) {
  nlohmann::ordered_json j;
  j["client"] = account.getClientId();
  j["available"] = account.getAvailable().toString();
  j["held"] = account.getHeld().toString();
  j["total"] = account.getTotal().toString();
  j["locked"] = account.isLocked();
  return j;
}

Roe<void> JsonWriter::write(const std::vector<Account> &accounts) {
  nlohmann::ordered_json document = nlohmann::ordered_json::array();
  for (const auto &account : accounts) {
    document.push_back(toJson(account));
  }
  output_ << document.dump(indent_) << '\n';
  output_.flush();
  if (!output_) {
    return Error(1, "failed to write account snapshot");
  }
  return {};
}

} // namespace payproc
