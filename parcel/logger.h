#ifndef PARCEL_LOGGER_H_
#define PARCEL_LOGGER_H_

#include <cstdarg>
#include <functional>
#include <map>
#include <mutex>
#include <string>

#include "absl/status/status.h"
#include "parcel/common.h"

namespace parcel {
/*
  Logger is a singleton class that provides basic thread-safe logging
  functionality. It is used by the PARCEL_LOG_* macros defined below from
  internal sources.

  The logger can be configured to log at a certain verbosity level, e.g., only
  warnings and errors if its verbosity is set to kWarning. The logger
  provides two additional ways to handle log messages. First, the logger can be
  configured to report log messages to user-defined reporter function. Second,
  the logger provides a way to retrieve the last log message via
  GetLastLog().

  Worker processes are forked from a multi-threaded coordinator, so the logger
  holds its lock across fork() and releases it on both sides. A child never
  starts with the lock taken by a thread that does not exist in it.
*/

class Logger {
 public:
  static Logger& Get();

  void SetVerbosity(LogSeverity severity);
  LogSeverity GetVerbosity() const;
  CallbackId SetReporter(
      std::function<void(LogSeverity, const char*)> reporter);
  absl::Status RemoveReporter(CallbackId callback_id);
  std::pair<LogSeverity, std::string> GetLastLog() const;

  // DebugLog is only enabled in debug mode.
  void DebugLog(const char* format, ...);
  void Log(LogSeverity severity, const char* format, ...);

 private:
  void LogFormatted(LogSeverity severity, const char* format, va_list args);

  static void PrepareFork();
  static void ReleaseAfterFork();

  Logger();
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  mutable std::mutex mtx_;
  CallbackId next_callback_id_ = 0;
  std::map<CallbackId, std::function<void(LogSeverity, const char*)>>
      reporters_;

  LogSeverity verbosity_ = LogSeverity::kInfo;
  std::pair<LogSeverity, std::string> last_message_;
};
}  // namespace parcel

#ifdef NDEBUG
#define PARCEL_LOG_DEBUG(format, ...) \
  do {                                \
  } while (false);
#else
#define PARCEL_LOG_DEBUG(format, ...) \
  parcel::Logger::Get().DebugLog(format, ##__VA_ARGS__);
#endif

#define PARCEL_LOG(severity, format, ...) \
  parcel::Logger::Get().Log(severity, format, ##__VA_ARGS__);

// Convenience macro for logging a statement *once* for a given process lifetime
#define PARCEL_LOG_ONCE(severity, format, ...)    \
  do {                                            \
    static const bool s_logged = [&] {            \
      PARCEL_LOG(severity, format, ##__VA_ARGS__) \
      return true;                                \
    }();                                          \
    (void)s_logged;                               \
  } while (false);

#endif  // PARCEL_LOGGER_H_
