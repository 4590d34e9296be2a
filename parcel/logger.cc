#include "parcel/logger.h"

#include <pthread.h>

#include <cstdarg>
#include <cstdio>
#include <vector>

#include "absl/strings/str_format.h"

namespace parcel {

Logger& Logger::Get() {
  static Logger* logger = new Logger;
  return *logger;
}

Logger::Logger() {
  pthread_atfork(&Logger::PrepareFork, &Logger::ReleaseAfterFork,
                 &Logger::ReleaseAfterFork);
}

void Logger::PrepareFork() { Get().mtx_.lock(); }

void Logger::ReleaseAfterFork() { Get().mtx_.unlock(); }

void Logger::SetVerbosity(LogSeverity severity) {
  std::lock_guard<std::mutex> lock(mtx_);
  verbosity_ = severity;
}

LogSeverity Logger::GetVerbosity() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return verbosity_;
}

CallbackId Logger::SetReporter(
    std::function<void(LogSeverity, const char*)> reporter) {
  std::lock_guard<std::mutex> lock(mtx_);
  reporters_[next_callback_id_] = reporter;
  return next_callback_id_++;
}

absl::Status Logger::RemoveReporter(CallbackId callback_id) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (reporters_.erase(callback_id) == 0) {
    return absl::NotFoundError(
        absl::StrFormat("Reporter %d is not registered", callback_id));
  }
  return absl::OkStatus();
}

std::pair<LogSeverity, std::string> Logger::GetLastLog() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return last_message_;
}

void Logger::DebugLog(const char* format, ...) {
  va_list args;
  va_start(args, format);
  LogFormatted(LogSeverity::kInternal, format, args);
  va_end(args);
}

void Logger::Log(LogSeverity severity, const char* format, ...) {
  va_list args;
  va_start(args, format);
  LogFormatted(severity, format, args);
  va_end(args);
}

void Logger::LogFormatted(LogSeverity severity, const char* format,
                          va_list args) {
  char buffer[2048];
  std::vector<std::function<void(LogSeverity, const char*)>> reporters;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (severity < verbosity_) {
      return;
    }

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-nonliteral"
    vsnprintf(buffer, sizeof(buffer), format, args);
#pragma GCC diagnostic pop

    fprintf(stderr, "%s: %s\n", ToString(severity), buffer);
    last_message_ = {severity, buffer};
    for (auto& reporter : reporters_) {
      reporters.push_back(reporter.second);
    }
  }

  // Reporters may log themselves
  for (auto& reporter : reporters) {
    reporter(severity, buffer);
  }
}

}  // namespace parcel
