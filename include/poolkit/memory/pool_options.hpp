#pragma once

#include <cstddef>
#include <string>

#include "poolkit/api/export.hpp"
#include "poolkit/api/status.hpp"
#include "poolkit/json/json_codec.hpp"

namespace poolkit {
namespace memory {

struct ObjectPoolOptions {
  // Label used in log lines.
  std::string name = "poolkit.memory.object_pool";
  // Storage slots reserved up front. A hint, not a limit.
  std::size_t initial_capacity = 0;
};

// Fill *out from the entry named pool_name inside a "pools" section object.
// A missing entry leaves *out at its defaults (name set to pool_name).
// Returns kInvalidArgument (module kPool) on wrong shapes or types.
POOLKIT_API api::Status ParseObjectPoolOptions(const json::Json& pools_section,
                                               const std::string& pool_name,
                                               ObjectPoolOptions* out);

// Load options for pool_name from a config file:
// {
//   "pools": {
//     "<pool_name>": { "initial_capacity": 64 }
//   }
// }
// Returns kNotFound when the file is missing.
POOLKIT_API api::Result<ObjectPoolOptions> LoadObjectPoolOptions(const std::string& config_path,
                                                                 const std::string& pool_name);

}  // namespace memory
}  // namespace poolkit
