#include "Module.h"

namespace payproc {

Module::Module(const std::string &name) : loggerName_(name) {}

const std::string &Module::getLoggerName() const { return loggerName_; }

logging::Logger &Module::log() const { return logging::getLogger(loggerName_); }

} // namespace payproc
