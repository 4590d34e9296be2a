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

#ifndef PARCEL_PROGRESS_H_
#define PARCEL_PROGRESS_H_

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

#include "parcel/common.h"

namespace parcel {

// Emitted once per resolved task, in completion order.
struct CompletionEvent {
  TaskId task_id = -1;
  WorkerId worker_id = -1;
  TaskStatus status = TaskStatus::kSuccess;
  // Microseconds between dispatch and reply
  int64_t elapsed_us = 0;
};

// Receiver of progress updates. Only ever called from the consumer thread of
// a ProgressChannel, one call at a time.
class ProgressSink {
 public:
  virtual ~ProgressSink() = default;
  virtual void OnStart(const std::string& label, size_t total) {}
  virtual void OnProgress(size_t completed, size_t total,
                          const CompletionEvent& event) = 0;
  virtual void OnFinish(size_t completed, size_t total) {}
};

// Reports progress through the logger.
class LogProgressSink : public ProgressSink {
 public:
  explicit LogProgressSink(LogSeverity severity = LogSeverity::kInfo)
      : severity_(severity) {}
  void OnStart(const std::string& label, size_t total) override;
  void OnProgress(size_t completed, size_t total,
                  const CompletionEvent& event) override;
  void OnFinish(size_t completed, size_t total) override;

 private:
  const LogSeverity severity_;
  std::string label_;
};

/**
 * @brief Queue of completion events with a single consumer thread that owns
 * the sink.
 *
 * Producers (the pool dispatcher) only append to the queue, so a slow sink
 * never stalls task dispatch. The completion counter is advanced by the
 * consumer and is monotonic.
 */
class ProgressChannel {
 public:
  ProgressChannel(ProgressSink* sink, std::string label, size_t total);
  ~ProgressChannel();

  ProgressChannel(const ProgressChannel&) = delete;
  ProgressChannel& operator=(const ProgressChannel&) = delete;

  void Push(const CompletionEvent& event);
  // Delivers the queued events, reports the end and joins the consumer.
  void Close();
  size_t GetCompleted() const;
  size_t GetTotal() const { return total_; }

 private:
  void Consume();

  ProgressSink* const sink_;
  const std::string label_;
  const size_t total_;

  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::deque<CompletionEvent> events_;
  size_t completed_ = 0;
  bool closed_ = false;
  std::thread consumer_;
};

}  // namespace parcel

#endif  // PARCEL_PROGRESS_H_
