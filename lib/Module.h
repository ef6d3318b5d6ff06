#pragma once

#include "Logger.h"
#include <string>

namespace powledger {

/**
 * Base class for modules that need logging functionality.
 * Provides a common interface for logger management across components.
 */
class Module {
public:
  /**
   * Constructor
   * @param name Hierarchical name for the module's logger (e.g.,
   * "pow.node.transport")
   */
  explicit Module(const std::string &name);

  virtual ~Module() = default;

  // Delete copy operations
  Module(const Module &) = delete;
  Module &operator=(const Module &) = delete;

  /**
   * Redirect this module's logger to another logger
   * @param targetLoggerName Name of the target logger
   */
  void redirectLogger(const std::string &targetLoggerName);

  const std::string &getLoggerName() const { return loggerName_; }

  /**
   * Get the logger instance for this module.
   * Use this to access the logger in derived classes and externally.
   *
   * @return Reference to the logger instance
   */
  logging::Logger &log() const;

private:
  std::string loggerName_;
  mutable logging::Logger logger_;
};

} // namespace powledger
