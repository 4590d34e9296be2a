#ifndef PARCEL_COMMON_H_
#define PARCEL_COMMON_H_

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "absl/types/optional.h"

namespace parcel {
typedef int WorkerId;
typedef int DeviceId;
typedef int TaskId;
typedef int CallbackId;

/**
 * @brief Returns the number of elements in an enumeration type.
 *
 * Specialized in common.cc for every enumeration that is parsed from a
 * configuration file.
 *
 * @tparam EnumType The enumeration type.
 * @return The number of elements in the enumeration type.
 */
template <typename EnumType>
size_t EnumLength() {
  assert(false && "EnumLength is not implemented for this type.");
  return 0;
}

/**
 * @brief Converts an enumeration value to its string representation.
 *
 * @tparam EnumType The enumeration type.
 * @param t The enumeration value to convert.
 * @return The string representation of the enumeration value.
 */
template <typename EnumType>
const char* ToString(EnumType t) {
  assert(false && "ToString is not implemented for this type.");
  return "";
}

/**
 * @brief Converts a string representation back to the enumeration value.
 *
 * @return The matching value, or nullopt if `str` names no value of the
 * enumeration.
 */
template <typename EnumType>
absl::optional<EnumType> FromString(absl::string_view str) {
  for (size_t i = 0; i < EnumLength<EnumType>(); i++) {
    EnumType t = static_cast<EnumType>(i);
    if (str == ToString(t)) {
      return t;
    }
  }
  return absl::nullopt;
}

enum class LogSeverity : size_t {
  // for internal use
  kInternal = 0,
  // for general information (default)
  kInfo,
  kWarning,
  kError
};

// Where the workload runs. Accelerator mode partitions per device and binds
// each worker process to one device id.
enum class ExecutionMode : size_t {
  kCPU = 0,
  kAccelerator,
};

enum class SubmissionMode : size_t {
  // Submit every chunk at once and rely on the pool queue
  kUnthrottled = 0,
  // Bound the number of outstanding handles
  kThrottled,
};

// Life-cycle of a single engine invocation.
enum class EngineState : size_t {
  kCreated = 0,
  kSubmitting,
  kDraining,
  kClosed,
};

// Outcome of a dispatched task, reported with its completion event.
enum class TaskStatus : size_t {
  kSuccess = 0,
  kExecutionFailure,
  kProcessLoss,
};

template <>
size_t EnumLength<LogSeverity>();
template <>
size_t EnumLength<ExecutionMode>();
template <>
size_t EnumLength<SubmissionMode>();
template <>
size_t EnumLength<EngineState>();
template <>
size_t EnumLength<TaskStatus>();

template <>
const char* ToString(LogSeverity log_severity);
template <>
const char* ToString(ExecutionMode execution_mode);
template <>
const char* ToString(SubmissionMode submission_mode);
template <>
const char* ToString(EngineState engine_state);
template <>
const char* ToString(TaskStatus task_status);

}  // namespace parcel

// Helper macro to return error status
#define RETURN_IF_ERROR(expr) \
  {                           \
    auto status = (expr);     \
    if (!status.ok()) {       \
      return status;          \
    }                         \
  }

#endif  // PARCEL_COMMON_H_
