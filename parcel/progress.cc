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

#include "parcel/progress.h"

#include "parcel/logger.h"

namespace parcel {

void LogProgressSink::OnStart(const std::string& label, size_t total) {
  label_ = label;
  PARCEL_LOG(severity_, "Processing %s... (%zu tasks)", label_.c_str(),
             total);
}

void LogProgressSink::OnProgress(size_t completed, size_t total,
                                 const CompletionEvent& event) {
  PARCEL_LOG(severity_, "[%s] %zu/%zu done (task %d on worker %d, %s, %lld us)",
             label_.c_str(), completed, total, event.task_id,
             event.worker_id, ToString(event.status),
             static_cast<long long>(event.elapsed_us));
}

void LogProgressSink::OnFinish(size_t completed, size_t total) {
  PARCEL_LOG(severity_, "[%s] finished %zu of %zu tasks", label_.c_str(),
             completed, total);
}

ProgressChannel::ProgressChannel(ProgressSink* sink, std::string label,
                                 size_t total)
    : sink_(sink), label_(label), total_(total) {
  if (sink_) {
    sink_->OnStart(label_, total_);
  }
  consumer_ = std::thread([this] { this->Consume(); });
}

ProgressChannel::~ProgressChannel() { Close(); }

void ProgressChannel::Push(const CompletionEvent& event) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (closed_) {
      PARCEL_LOG(LogSeverity::kWarning,
                 "Progress event of task %d after the channel closed",
                 event.task_id);
      return;
    }
    events_.push_back(event);
  }
  cv_.notify_one();
}

void ProgressChannel::Close() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    closed_ = true;
  }
  cv_.notify_all();
  if (consumer_.joinable()) {
    consumer_.join();
  }
}

size_t ProgressChannel::GetCompleted() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return completed_;
}

void ProgressChannel::Consume() {
  while (true) {
    std::unique_lock<std::mutex> lock(mtx_);
    cv_.wait(lock, [this]() { return closed_ || !events_.empty(); });

    if (events_.empty()) {
      // closed and drained
      const size_t completed = completed_;
      lock.unlock();
      if (sink_) {
        sink_->OnFinish(completed, total_);
      }
      break;
    }

    CompletionEvent event = events_.front();
    events_.pop_front();
    const size_t completed = ++completed_;
    lock.unlock();

    if (sink_) {
      sink_->OnProgress(completed, total_, event);
    }
  }
}

}  // namespace parcel
