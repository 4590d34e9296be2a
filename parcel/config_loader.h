#ifndef PARCEL_CONFIG_LOADER_H_
#define PARCEL_CONFIG_LOADER_H_

#include <string>

#include "absl/status/statusor.h"
#include "json/json.h"
#include "parcel/config.h"

namespace parcel {

/**
 * @brief Builds a RuntimeConfig from a JSON object.
 *
 * Recognized keys: `execution_mode` ("cpu" or "accelerator"), `output_dim`,
 * `num_workers`, `max_tasks_per_worker`, `device_count`, `chunk_size`,
 * `submission_mode` ("unthrottled" or "throttled"), `max_outstanding_tasks`,
 * `label` and `verbose`. Missing keys keep the builder defaults.
 * @return ConfigurationError for an unknown enum name, a value of the wrong
 * type or a configuration the builder rejects.
 */
absl::StatusOr<RuntimeConfig> LoadRuntimeConfig(const Json::Value& root);

// Loads and parses `file_path` first.
absl::StatusOr<RuntimeConfig> LoadRuntimeConfigFromFile(
    const std::string& file_path);

}  // namespace parcel

#endif  // PARCEL_CONFIG_LOADER_H_
