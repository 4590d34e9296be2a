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

#include "parcel/json_util.h"

#include <fstream>

#include "absl/strings/str_join.h"
#include "parcel/logger.h"

namespace parcel {
namespace json {

absl::StatusOr<Json::Value> LoadFromFile(const std::string& file_path) {
  std::ifstream in(file_path, std::ifstream::binary);
  if (!in.is_open()) {
    return ConfigurationError(
        absl::StrFormat("[Json] Cannot open %s", file_path));
  }
  if (in.peek() == std::ifstream::traits_type::eof()) {
    return ConfigurationError(absl::StrFormat("[Json] %s is empty", file_path));
  }

  Json::CharReaderBuilder reader;
  Json::Value root;
  std::string errors;
  if (!Json::parseFromStream(reader, in, &root, &errors)) {
    return ConfigurationError(
        absl::StrFormat("[Json] Failed to parse %s: %s", file_path, errors));
  }
  PARCEL_LOG_DEBUG("Loaded json config %s", file_path.c_str());
  return root;
}

absl::Status Validate(const Json::Value& root,
                      const std::vector<std::string>& required) {
  if (!root.isObject()) {
    return ConfigurationError("[Json] Config root must be a JSON object");
  }

  std::vector<std::string> missing;
  for (const std::string& key : required) {
    if (root[key].isNull()) {
      missing.push_back(key);
    }
  }
  if (!missing.empty()) {
    return ConfigurationError(absl::StrFormat(
        "[Json] Missing required keys: %s", absl::StrJoin(missing, ", ")));
  }
  return absl::OkStatus();
}

}  // namespace json
}  // namespace parcel
