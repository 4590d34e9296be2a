#ifndef PARCEL_JSON_UTIL_H_
#define PARCEL_JSON_UTIL_H_

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "json/json.h"
#include "parcel/error.h"

namespace parcel {
namespace json {

// Reads and parses `file_path`. A missing, empty or malformed file is a
// ConfigurationError.
absl::StatusOr<Json::Value> LoadFromFile(const std::string& file_path);

// Checks that `root` is an object and carries every key in `required`.
absl::Status Validate(const Json::Value& root,
                      const std::vector<std::string>& required);

// Copies `root[key]` into `lhs` when the key is present. A value of another
// JSON type is rejected and leaves `lhs` untouched. `root` must be an object.
template <typename T>
absl::Status AssignIfValid(T& lhs, const Json::Value& root, const char* key) {
  const Json::Value& value = root[key];
  if (value.isNull()) {
    return absl::OkStatus();
  }
  if (!value.is<T>()) {
    return ConfigurationError(
        absl::StrFormat("[Json] %s has an unexpected type", key));
  }
  lhs = value.as<T>();
  return absl::OkStatus();
}

}  // namespace json
}  // namespace parcel

#endif  // PARCEL_JSON_UTIL_H_
