#ifndef UTIL_LOG_MANAGER_HPP
#define UTIL_LOG_MANAGER_HPP
#include <kj/exception.h>
#include <kj/main.h>
#include <ostream>
#include "backward.hpp"

namespace util {

// Installs itself as the kj exception callback for its lifetime: every
// KJ_LOG record and every kj exception goes through it. Records go to
// Flags::log_file if set, to stderr otherwise; colours are used only when the
// output is a terminal.
class LogManager : public kj::ExceptionCallback {
 public:
  explicit LogManager(kj::ProcessContext* context);
  void logMessage(kj::LogSeverity severity, const char* file, int line,
                  int contextDepth, kj::String&& text) override;
  void onRecoverableException(kj::Exception&& exception) override;
  void onFatalException(kj::Exception&& exception) override;
  StackTraceMode stackTraceMode() override { return StackTraceMode::NONE; }

 private:
  void PrintStackTrace();

  std::ostream& out;
  bool colored;
  backward::SignalHandling sh;  // Override kj's signal handling.
};
}  // namespace util

#endif
