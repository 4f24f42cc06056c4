#ifndef PAYPROC_CONFIG_H
#define PAYPROC_CONFIG_H

#include "../lib/Logger.h"
#include "../lib/Utilities.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace payproc {

/**
 * Config - Runtime settings of the command-line tool.
 *
 * Settings are layered: defaults, then the PAYPROC_LOG environment variable,
 * then the JSON config file, then command-line flags. Each layer overwrites
 * only the settings it names.
 *
 * Config file keys (all optional):
 *   { "logLevel": "warning", "logFile": "run.log", "format": "csv" }
 */
struct Config {
  enum class Format { CSV, JSON };

  constexpr static int32_t E_CONFIG = 1;
  constexpr static const char *ENV_LOG_LEVEL = "PAYPROC_LOG";

  logging::Level logLevel{logging::Level::ERROR};
  std::string logFile;
  Format format{Format::CSV};

  Roe<void> applyLogLevel(const std::string &name);
  Roe<void> applyFormat(const std::string &name);

  // Reads PAYPROC_LOG if set
  Roe<void> applyEnvironment();

  Roe<void> ltsFromJson(const nlohmann::json &jd);
  Roe<void> loadFile(const std::string &path);
};

} // namespace payproc

#endif // PAYPROC_CONFIG_H
