#ifndef PAYPROC_MODULE_H
#define PAYPROC_MODULE_H

#include "Logger.h"

#include <string>

namespace payproc {

/**
 * Base class for modules that need logging functionality.
 * Provides a common interface for logger management across components.
 */
class Module {
public:
  /**
   * Constructor
   * @param name Hierarchical name for the module's logger (e.g.,
   * "app.processor")
   */
  explicit Module(const std::string &name);

  virtual ~Module() = default;

  Module(const Module &) = delete;
  Module &operator=(const Module &) = delete;

  const std::string &getLoggerName() const;

  /**
   * Get the logger instance for this module.
   * @return Reference to the logger instance
   */
  logging::Logger &log() const;

private:
  std::string loggerName_;
};

} // namespace payproc

#endif // PAYPROC_MODULE_H
