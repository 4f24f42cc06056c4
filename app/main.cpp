#include "Config.h"
#include "Runner.h"
#include "../lib/Lib.h"
#include "../lib/Logger.h"

#include <CLI/CLI.hpp>

#include <exception>
#include <iostream>
#include <string>

int main(int argc, char *argv[]) {
  payproc::Lib lib;
  CLI::App app{"payment-processor - Computes client account balances from "
               "account activity records"};
  app.set_version_flag("--version", lib.getVersion());

  std::string path;
  app.add_option("path", path, "File with account activity records (CSV)")
      ->required();

  bool silent = false;
  app.add_flag("--silent", silent, "Do not print the resulting accounts");

  std::string format;
  app.add_option("-f,--format", format, "Output format")
      ->check(CLI::IsMember({"csv", "json"}));

  std::string configPath;
  app.add_option("-c,--config", configPath, "JSON configuration file")
      ->check(CLI::ExistingFile);

  std::string logLevel;
  app.add_option("--log-level", logLevel,
                 "Log level: debug, info, warning, error, critical");

  std::string logFile;
  app.add_option("--log-file", logFile, "Append log messages to this file");

  bool debug = false;
  app.add_flag("--debug", debug, "Enable debug logging");

  CLI11_PARSE(app, argc, argv);

  payproc::Config config;
  auto envResult = config.applyEnvironment();
  if (!envResult) {
    std::cerr << "Warning: " << envResult.error().message << "\n";
  }

  if (!configPath.empty()) {
    auto result = config.loadFile(configPath);
    if (!result) {
      std::cerr << "Error: " << result.error().message << "\n";
      return 1;
    }
  }
  if (!logLevel.empty()) {
    auto result = config.applyLogLevel(logLevel);
    if (!result) {
      std::cerr << "Error: " << result.error().message << "\n";
      return 1;
    }
  }
  if (debug) {
    config.logLevel = payproc::logging::Level::DEBUG;
  }
  if (!logFile.empty()) {
    config.logFile = logFile;
  }
  if (!format.empty()) {
    auto result = config.applyFormat(format);
    if (!result) {
      std::cerr << "Error: " << result.error().message << "\n";
      return 1;
    }
  }

  auto &rootLogger = payproc::logging::getRootLogger();
  rootLogger.setLevel(config.logLevel);
  if (!config.logFile.empty()) {
    try {
      rootLogger.addFileHandler(config.logFile, config.logLevel);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << "\n";
      return 1;
    }
  }

  rootLogger.info << "payment-processor v" << lib.getVersion();
  payproc::Runner runner(std::cout, std::cerr);
  runner.setSilent(silent);
  return runner.runFile(path, config);
}
