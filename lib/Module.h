#ifndef HASHCHAIN_MODULE_H
#define HASHCHAIN_MODULE_H

#include "Logger.h"
#include <memory>
#include <string>

namespace hc {

/**
 * Base class for components that log under their own name.
 */
class Module {
public:
  /**
   * @param name Hierarchical logger name (e.g. "storage.file")
   */
  explicit Module(const std::string &name);
  virtual ~Module() = default;

  Module(const Module &) = delete;
  Module &operator=(const Module &) = delete;

  /**
   * Move this module's logger under another logger
   * @param targetLoggerName Name of the new parent logger
   */
  void redirectLogger(const std::string &targetLoggerName);

  const std::string &getLoggerName() const { return loggerName_; }

  logging::Logger &log() const;

private:
  std::string loggerName_;
  std::unique_ptr<logging::Logger> upLogger_;
};

} // namespace hc

#endif // HASHCHAIN_MODULE_H
