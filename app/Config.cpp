#include "Config.h"

#include <cstdlib>

namespace payproc {

Roe<void> Config::applyLogLevel(const std::string &name) {
  logging::Level level = logging::Level::ERROR;
  if (!logging::parseLevel(name, level)) {
    return Error(E_CONFIG, "Unknown log level: " + name);
  }
  logLevel = level;
  return {};
}

Roe<void> Config::applyFormat(const std::string &name) {
  std::string lower = utl::toLower(name);
  if (lower == "csv") {
    format = Format::CSV;
  } else if (lower == "json") {
    format = Format::JSON;
  } else {
    return Error(E_CONFIG, "Unknown output format: " + name);
  }
  return {};
}

Roe<void> Config::applyEnvironment() {
  const char *value = std::getenv(ENV_LOG_LEVEL);
  if (value == nullptr || *value == '\0') {
    return {};
  }
  auto result = applyLogLevel(value);
  if (!result) {
    return Error(E_CONFIG, std::string(ENV_LOG_LEVEL) + ": " +
                               result.error().message);
  }
  return {};
}

Roe<void> Config::ltsFromJson(const nlohmann::json &jd) {
  if (!jd.is_object()) {
    return Error(E_CONFIG, "Configuration must be a JSON object");
  }

  if (jd.contains("logLevel")) {
    if (!jd["logLevel"].is_string()) {
      return Error(E_CONFIG, "Configuration 'logLevel' field must be a string");
    }
    auto result = applyLogLevel(jd["logLevel"].get<std::string>());
    if (!result) {
      return result;
    }
  }

  if (jd.contains("logFile")) {
    if (!jd["logFile"].is_string()) {
      return Error(E_CONFIG, "Configuration 'logFile' field must be a string");
    }
    logFile = jd["logFile"].get<std::string>();
  }

  if (jd.contains("format")) {
    if (!jd["format"].is_string()) {
      return Error(E_CONFIG, "Configuration 'format' field must be a string");
    }
    auto result = applyFormat(jd["format"].get<std::string>());
    if (!result) {
      return result;
    }
  }

  return {};
}

Roe<void> Config::loadFile(const std::string &path) {
  auto jsonResult = utl::loadJsonFile(path);
  if (jsonResult.isError()) {
    return Error(E_CONFIG, jsonResult.error().message);
  }
  return ltsFromJson(jsonResult.value());
}

} // namespace payproc
