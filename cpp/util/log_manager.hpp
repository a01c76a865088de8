#ifndef UTIL_LOG_MANAGER_HPP
#define UTIL_LOG_MANAGER_HPP
#include <kj/exception.h>
#include <kj/main.h>
#include <mutex>
#include <ostream>
#include "backward.hpp"

namespace util {

// Routes kj logging to Flags::log_file (or stderr) for the lifetime of the
// object. Transfer workers log concurrently, so lines are serialized.
class LogManager : public kj::ExceptionCallback {
 public:
  explicit LogManager(kj::ProcessContext& context);
  void logMessage(kj::LogSeverity severity, const char* file, int line,
                  int contextDepth, kj::String&& text) override;
  void onRecoverableException(kj::Exception&& exception) override;
  void onFatalException(kj::Exception&& exception) override;
  StackTraceMode stackTraceMode() override { return StackTraceMode::NONE; }

 private:
  void printStackTrace();

  std::ostream& out;
  bool color;
  std::mutex mutex;
  backward::SignalHandling sh;  // Override kj's signal handling.
};
}  // namespace util

#endif
