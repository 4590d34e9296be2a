#ifndef PARCEL_PAYLOAD_H_
#define PARCEL_PAYLOAD_H_

#include <cstring>
#include <string>
#include <type_traits>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "absl/types/optional.h"
#include "parcel/partitioner.h"

namespace parcel {

// Encoded output of one task: one entry per output bucket, each holding the
// raw bytes of a column of trivially copyable values, or nullopt for a null
// bucket.
using ResultSet = std::vector<absl::optional<std::string>>;

std::string EncodeResultSet(const ResultSet& result_set);
absl::StatusOr<ResultSet> DecodeResultSet(absl::string_view bytes);

std::string EncodeChunk(const Chunk& chunk);
absl::StatusOr<Chunk> DecodeChunk(absl::string_view bytes);

template <typename T>
std::string EncodeColumn(const std::vector<T>& values) {
  static_assert(std::is_trivially_copyable<T>::value,
                "Only trivially copyable values cross the worker boundary");
  return std::string(reinterpret_cast<const char*>(values.data()),
                     values.size() * sizeof(T));
}

// Appends the values encoded in `bytes` to `values`.
template <typename T>
absl::Status DecodeColumn(absl::string_view bytes, std::vector<T>& values) {
  static_assert(std::is_trivially_copyable<T>::value,
                "Only trivially copyable values cross the worker boundary");
  if (bytes.size() % sizeof(T) != 0) {
    return absl::DataLossError(
        absl::StrFormat("Column of %d bytes is not a multiple of %d-byte items",
                        bytes.size(), sizeof(T)));
  }
  const size_t offset = values.size();
  values.resize(offset + bytes.size() / sizeof(T));
  if (!bytes.empty()) {
    std::memcpy(values.data() + offset, bytes.data(), bytes.size());
  }
  return absl::OkStatus();
}

}  // namespace parcel

#endif  // PARCEL_PAYLOAD_H_
