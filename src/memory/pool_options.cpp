#include "poolkit/memory/pool_options.hpp"

#include <cstdint>

namespace poolkit {
namespace memory {

#define PK_STATUS(code, message) \
  api::Status::FromModule((code), (message), api::ErrorModule::kPool, 0x0001)

api::Status ParseObjectPoolOptions(const json::Json& pools_section, const std::string& pool_name,
                                   ObjectPoolOptions* out) {
  if (out == NULL) {
    return api::Status::FromModule(api::StatusCode::kInvalidArgument, "out is null",
                                   api::ErrorModule::kPool);
  }
  if (pool_name.empty()) {
    return api::Status::FromModule(api::StatusCode::kInvalidArgument, "pool name is empty",
                                   api::ErrorModule::kPool);
  }
  if (!pools_section.is_object()) {
    return PK_STATUS(api::StatusCode::kInvalidArgument, "pools must be JSON object");
  }

  ObjectPoolOptions options;
  options.name = pool_name;

  json::Json::const_iterator entry = pools_section.find(pool_name);
  if (entry == pools_section.end()) {
    *out = options;
    return api::Status::Ok();
  }
  if (!entry->is_object()) {
    return PK_STATUS(api::StatusCode::kInvalidArgument,
                     "pools." + pool_name + " must be JSON object");
  }

  json::Json::const_iterator capacity = entry->find("initial_capacity");
  if (capacity != entry->end()) {
    if (!capacity->is_number_unsigned()) {
      return PK_STATUS(api::StatusCode::kInvalidArgument,
                       "pools." + pool_name + ".initial_capacity must be a non-negative integer");
    }
    options.initial_capacity = static_cast<std::size_t>(capacity->get<std::uint64_t>());
  }

  *out = options;
  return api::Status::Ok();
}

api::Result<ObjectPoolOptions> LoadObjectPoolOptions(const std::string& config_path,
                                                     const std::string& pool_name) {
  api::Result<json::Json> loaded = json::JsonCodec::LoadFile(config_path);
  if (!loaded.ok()) {
    return api::Result<ObjectPoolOptions>(loaded.status());
  }

  const json::Json* pools = NULL;
  api::Status st =
      json::JsonCodec::FindSection(loaded.value(), "pools", api::ErrorModule::kPool, &pools);
  if (!st.ok()) {
    return api::Result<ObjectPoolOptions>(st);
  }

  ObjectPoolOptions options;
  st = ParseObjectPoolOptions(pools != NULL ? *pools : json::Json::object(), pool_name, &options);
  if (!st.ok()) {
    return api::Result<ObjectPoolOptions>(st);
  }
  return api::Result<ObjectPoolOptions>(options);
}

#undef PK_STATUS

}  // namespace memory
}  // namespace poolkit
