#include "Logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <unordered_map>

namespace payproc {
namespace logging {

// Helper function to trim leading dot from logger name
static std::string trimLeadingDot(const std::string &name) {
  if (!name.empty() && name[0] == '.') {
    return name.substr(1);
  }
  return name;
}

static std::mutex &getRegistryMutex() {
  static std::mutex mutex;
  return mutex;
}

struct RegistryEntry {
  std::shared_ptr<LoggerNode> spNode;
  std::unique_ptr<Logger> upLogger;
};

// Registry keyed by full hierarchical name; the root logger is "".
static std::unordered_map<std::string, RegistryEntry> &getLoggerRegistry() {
  static std::unordered_map<std::string, RegistryEntry> registry;
  return registry;
}

static std::string getCurrentTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm tm{};
  localtime_r(&time, &tm);
  std::stringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

std::string levelToString(Level level) {
  switch (level) {
  case Level::DEBUG:
    return "DEBUG";
  case Level::INFO:
    return "INFO";
  case Level::WARNING:
    return "WARNING";
  case Level::ERROR:
    return "ERROR";
  case Level::CRITICAL:
    return "CRITICAL";
  }
  return "UNKNOWN";
}

bool parseLevel(const std::string &name, Level &level) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "debug" || lower == "trace") {
    level = Level::DEBUG;
  } else if (lower == "info") {
    level = Level::INFO;
  } else if (lower == "warning" || lower == "warn") {
    level = Level::WARNING;
  } else if (lower == "error") {
    level = Level::ERROR;
  } else if (lower == "critical") {
    level = Level::CRITICAL;
  } else {
    return false;
  }
  return true;
}

// ConsoleHandler implementation
void ConsoleHandler::emit(Level level, const std::string &loggerName,
                          const std::string &message) {
  if (level < level_) {
    return;
  }
  std::cerr << message << std::endl;
}

// FileHandler implementation
FileHandler::FileHandler(const std::string &filename) : filename_(filename) {
  file_.open(filename_, std::ios::app);
  if (!file_.is_open()) {
    throw std::runtime_error("Failed to open log file: " + filename_);
  }
}

FileHandler::~FileHandler() {
  if (file_.is_open()) {
    file_.close();
  }
}

void FileHandler::emit(Level level, const std::string &loggerName,
                       const std::string &message) {
  if (level < level_) {
    return;
  }
  if (file_.is_open()) {
    file_ << message << std::endl;
  }
}

// LogProxy implementation
LogProxy::LogProxy(Logger *logger, Level level)
    : logger_(logger), level_(level) {}

// LogStream implementation
LogStream::LogStream(Logger *logger, Level level)
    : logger_(logger), level_(level), moved_(false) {}

LogStream::~LogStream() {
  if (!moved_ && logger_) {
    logger_->log(level_, stream_.str());
  }
}

LogStream::LogStream(LogStream &&other) noexcept
    : logger_(other.logger_), level_(other.level_),
      stream_(std::move(other.stream_)), moved_(false) {
  other.moved_ = true;
}

LogStream &LogStream::operator=(LogStream &&other) noexcept {
  if (this != &other) {
    logger_ = other.logger_;
    level_ = other.level_;
    stream_ = std::move(other.stream_);
    moved_ = false;
    other.moved_ = true;
  }
  return *this;
}

// ========== LoggerNode Implementation ==========

LoggerNode::LoggerNode(const std::string &name) : name_(name) {}

std::string LoggerNode::getFullName() const {
  std::vector<std::string> parts;

  auto current = shared_from_this();
  while (current && !current->getName().empty()) {
    parts.push_back(current->getName());
    current = current->getParent();
  }

  std::string fullName;
  for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
    if (!fullName.empty()) {
      fullName += ".";
    }
    fullName += *it;
  }
  return fullName;
}

void LoggerNode::addHandler(std::shared_ptr<Handler> spHandler) {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.push_back(spHandler);
}

void LoggerNode::addFileHandler(const std::string &filename, Level level) {
  auto spHandler = std::make_shared<FileHandler>(filename);
  spHandler->setLevel(level);
  addHandler(spHandler);
}

void LoggerNode::clearHandlers() {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.clear();
}

void LoggerNode::log(Level level, const std::string &message) {
  logWithOriginatingName(level, message, getFullName());
}

void LoggerNode::logWithOriginatingName(
    Level level, const std::string &message,
    const std::string &originatingLoggerName) {
  if (level >= level_) {
    std::vector<std::shared_ptr<Handler>> handlers;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      handlers = spHandlers_;
    }
    if (!handlers.empty()) {
      std::string formatted =
          formatMessage(level, message, originatingLoggerName);
      for (auto &spHandler : handlers) {
        spHandler->emit(level, originatingLoggerName, formatted);
      }
    }
  }

  if (propagate_) {
    auto parentNode = getParent();
    if (parentNode) {
      parentNode->logWithOriginatingName(level, message,
                                         originatingLoggerName);
    }
  }
}

std::string
LoggerNode::formatMessage(Level level, const std::string &message,
                          const std::string &originatingLoggerName) const {
  std::stringstream ss;
  ss << "[" << getCurrentTimestamp() << "] ";
  ss << "[" << levelToString(level) << "] ";
  if (!originatingLoggerName.empty()) {
    ss << "[" << originatingLoggerName << "] ";
  }
  ss << message;
  return ss.str();
}

// ========== Logger Implementation ==========

Logger::Logger(std::shared_ptr<LoggerNode> node)
    : debug(this, Level::DEBUG), info(this, Level::INFO),
      warning(this, Level::WARNING), error(this, Level::ERROR),
      critical(this, Level::CRITICAL), spNode_(node) {}

// ========== Global logger management ==========

// Caller holds the registry mutex.
static RegistryEntry &getOrCreateLocked(const std::string &name) {
  auto &registry = getLoggerRegistry();
  auto it = registry.find(name);
  if (it != registry.end()) {
    return it->second;
  }

  if (name.empty()) {
    auto root = std::make_shared<LoggerNode>("");
    root->addHandler(std::make_shared<ConsoleHandler>());
    auto inserted = registry.emplace(
        name, RegistryEntry{root, std::make_unique<Logger>(root)});
    return inserted.first->second;
  }

  std::string nodeName = name;
  std::string parentPath;
  auto lastDot = name.rfind('.');
  if (lastDot != std::string::npos) {
    parentPath = name.substr(0, lastDot);
    nodeName = name.substr(lastDot + 1);
  }

  // Parent first, so the whole path exists before this node is attached
  auto spParent = getOrCreateLocked(parentPath).spNode;
  auto node = std::make_shared<LoggerNode>(nodeName);
  node->setParent(spParent);
  auto inserted = registry.emplace(
      name, RegistryEntry{node, std::make_unique<Logger>(node)});
  return inserted.first->second;
}

Logger &getLogger(const std::string &name) {
  std::lock_guard<std::mutex> lock(getRegistryMutex());
  return *getOrCreateLocked(trimLeadingDot(name)).upLogger;
}

Logger &getRootLogger() { return getLogger(""); }

} // namespace logging
} // namespace payproc
