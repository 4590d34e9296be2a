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

#include "parcel/logger.h"
#include "parcel/tool/runner.h"

using namespace parcel;

int main(int argc, const char** argv) {
  parcel::tool::Runner runner;
  if (runner.Initialize(argc, argv).ok()) {
    auto status = runner.Run();
    if (!status.ok()) {
      PARCEL_LOG(LogSeverity::kError, "Runner failed: %s",
                 std::string(status.message()).c_str());
      return -1;
    }
  } else {
    PARCEL_LOG(LogSeverity::kError, "Runner failed to initialize");
    return -1;
  }
  return 0;
}
