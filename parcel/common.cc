// Copyright 2023 Seoul National University
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "parcel/common.h"

namespace parcel {

template <>
size_t EnumLength<LogSeverity>() {
  return static_cast<size_t>(LogSeverity::kError) + 1;
}

template <>
size_t EnumLength<ExecutionMode>() {
  return static_cast<size_t>(ExecutionMode::kAccelerator) + 1;
}

template <>
size_t EnumLength<SubmissionMode>() {
  return static_cast<size_t>(SubmissionMode::kThrottled) + 1;
}

template <>
size_t EnumLength<EngineState>() {
  return static_cast<size_t>(EngineState::kClosed) + 1;
}

template <>
size_t EnumLength<TaskStatus>() {
  return static_cast<size_t>(TaskStatus::kProcessLoss) + 1;
}

template <>
const char* ToString(LogSeverity log_severity) {
  switch (log_severity) {
    case LogSeverity::kInternal: {
      return "INTERNAL";
    } break;
    case LogSeverity::kInfo: {
      return "INFO";
    } break;
    case LogSeverity::kWarning: {
      return "WARNING";
    } break;
    case LogSeverity::kError: {
      return "ERROR";
    } break;
    default: {
      return "Unknown log severity";
    } break;
  }
}

template <>
const char* ToString(ExecutionMode execution_mode) {
  switch (execution_mode) {
    case ExecutionMode::kCPU: {
      return "cpu";
    } break;
    case ExecutionMode::kAccelerator: {
      return "accelerator";
    } break;
    default: {
      return "Unknown execution mode";
    } break;
  }
}

template <>
const char* ToString(SubmissionMode submission_mode) {
  switch (submission_mode) {
    case SubmissionMode::kUnthrottled: {
      return "unthrottled";
    } break;
    case SubmissionMode::kThrottled: {
      return "throttled";
    } break;
    default: {
      return "Unknown submission mode";
    } break;
  }
}

template <>
const char* ToString(EngineState engine_state) {
  switch (engine_state) {
    case EngineState::kCreated: {
      return "CREATED";
    } break;
    case EngineState::kSubmitting: {
      return "SUBMITTING";
    } break;
    case EngineState::kDraining: {
      return "DRAINING";
    } break;
    case EngineState::kClosed: {
      return "CLOSED";
    } break;
    default: {
      return "Unknown engine state";
    } break;
  }
}

template <>
const char* ToString(TaskStatus task_status) {
  switch (task_status) {
    case TaskStatus::kSuccess: {
      return "Success";
    } break;
    case TaskStatus::kExecutionFailure: {
      return "ExecutionFailure";
    } break;
    case TaskStatus::kProcessLoss: {
      return "ProcessLoss";
    } break;
    default: {
      return "Unknown task status";
    } break;
  }
}

}  // namespace parcel
