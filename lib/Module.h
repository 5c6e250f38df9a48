#pragma once

#include "Logger.h"
#include <string>

namespace lfs {

/**
 * Base class for components that log.
 * Binds a named logger once so derived classes can write log().info << ...
 */
class Module {
public:
  /**
   * Constructor
   * @param name Hierarchical logger name (e.g. "ledger.chain")
   */
  explicit Module(const std::string &name);

  virtual ~Module() = default;

  Module(const Module &) = delete;
  Module &operator=(const Module &) = delete;

  /**
   * Re-parent this module's logger under another logger
   * @param targetLoggerName Name of the target logger
   */
  void redirectLogger(const std::string &targetLoggerName);

  const std::string &getLoggerName() const { return loggerName_; }

  logging::Logger &log() const { return logger_; }

private:
  std::string loggerName_;
  mutable logging::Logger logger_;
};

} // namespace lfs
