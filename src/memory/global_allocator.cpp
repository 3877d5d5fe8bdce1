#include "poolkit/memory/global_allocator.hpp"

#include <memory>
#include <mutex>
#include <string>

#include <glog/logging.h>

#include "memory/backend_allocators.hpp"
#include "poolkit/json/json_codec.hpp"

namespace poolkit {
namespace memory {

#define PK_STATUS(code, message) \
  api::Status::FromModule((code), (message), api::ErrorModule::kMemory, 0x0001)

namespace {

// Process-lifetime state is never destroyed: pools with static storage
// duration may still free through it during static destruction.
std::mutex& ConfigureMu() {
  static std::mutex* mu = new std::mutex();
  return *mu;
}

// Guarded by ConfigureMu().
std::shared_ptr<IAllocator>& CurrentAllocator() {
  static std::shared_ptr<IAllocator>* state =
      new std::shared_ptr<IAllocator>(new SystemAllocator());
  return *state;
}

GlobalAllocatorOptions& GlobalOptions() {
  static GlobalAllocatorOptions* opts = new GlobalAllocatorOptions();
  return *opts;
}

api::Result<std::shared_ptr<IAllocator> > CreateAllocator(AllocBackend backend) {
  typedef api::Result<std::shared_ptr<IAllocator> > Created;
  switch (backend) {
    case AllocBackend::kSystem:
      return Created(std::shared_ptr<IAllocator>(new SystemAllocator()));
#if defined(POOLKIT_ENABLE_MIMALLOC_BACKEND)
    case AllocBackend::kMimalloc:
      return Created(std::shared_ptr<IAllocator>(new MimallocAllocator()));
#endif
#if defined(POOLKIT_ENABLE_TBBMALLOC_BACKEND)
    case AllocBackend::kTbbScalable:
      return Created(std::shared_ptr<IAllocator>(new TbbAllocator()));
#endif
    default:
      return Created(api::Status::FromModule(
          api::StatusCode::kUnsupported, "requested allocator backend is not enabled in this build",
          api::ErrorModule::kMemory, 0x0001));
  }
}

api::Status ParseBackend(const std::string& value, AllocBackend* out) {
  if (value == "system") {
    *out = AllocBackend::kSystem;
    return api::Status::Ok();
  }
  if (value == "tbb" || value == "tbb_scalable") {
    *out = AllocBackend::kTbbScalable;
    return api::Status::Ok();
  }
  if (value == "mimalloc" || value == "mi") {
    *out = AllocBackend::kMimalloc;
    return api::Status::Ok();
  }
  return api::Status::FromModule(api::StatusCode::kInvalidArgument,
                                 "memory.backend is invalid: " + value,
                                 api::ErrorModule::kMemory);
}

}  // namespace

api::Status GlobalAllocator::Configure(const GlobalAllocatorOptions& options) {
  std::lock_guard<std::mutex> lock(ConfigureMu());

  GlobalAllocatorOptions normalized = options;
  if (normalized.backend == GlobalOptions().backend) {
    GlobalOptions() = normalized;
    return api::Status::Ok();
  }

  const AllocatorStats current_stats = CurrentAllocator()->Stats();
  if (current_stats.bytes_in_use != 0) {
    return PK_STATUS(api::StatusCode::kWouldBlock,
                     "cannot switch allocator backend while memory is still in use");
  }

  api::Result<std::shared_ptr<IAllocator> > created = CreateAllocator(normalized.backend);
  if (!created.ok()) {
    if (normalized.strict_backend) {
      return created.status();
    }
    LOG(WARNING) << "allocator backend " << BackendDisplayName(normalized.backend)
                 << " unavailable, falling back to system";
    created = CreateAllocator(AllocBackend::kSystem);
    if (!created.ok()) {
      return created.status();
    }
    normalized.backend = AllocBackend::kSystem;
  }

  CurrentAllocator() = created.value();
  GlobalOptions() = normalized;
  VLOG(1) << "allocator backend set to " << CurrentAllocator()->BackendName();
  return api::Status::Ok();
}

api::Status GlobalAllocator::ConfigureFromFile(const std::string& config_path) {
  api::Result<json::Json> loaded = json::JsonCodec::LoadFile(config_path);
  if (!loaded.ok()) {
    return loaded.status();
  }

  const json::Json* memory = NULL;
  api::Status st =
      json::JsonCodec::FindSection(loaded.value(), "memory", api::ErrorModule::kMemory, &memory);
  if (!st.ok()) {
    return st;
  }
  if (memory == NULL) {
    return api::Status::Ok();
  }

  GlobalAllocatorOptions options;
  {
    std::lock_guard<std::mutex> lock(ConfigureMu());
    options = GlobalOptions();
  }

  json::Json::const_iterator backend = memory->find("backend");
  if (backend != memory->end()) {
    if (!backend->is_string()) {
      return api::Status::FromModule(api::StatusCode::kInvalidArgument,
                                     "memory.backend must be string", api::ErrorModule::kMemory);
    }
    st = ParseBackend(backend->get<std::string>(), &options.backend);
    if (!st.ok()) {
      return st;
    }
  }

  json::Json::const_iterator strict = memory->find("strict_backend");
  if (strict != memory->end()) {
    if (!strict->is_boolean()) {
      return api::Status::FromModule(api::StatusCode::kInvalidArgument,
                                     "memory.strict_backend must be boolean",
                                     api::ErrorModule::kMemory);
    }
    options.strict_backend = strict->get<bool>();
  }

  return Configure(options);
}

std::shared_ptr<IAllocator> GlobalAllocator::Current() {
  std::lock_guard<std::mutex> lock(ConfigureMu());
  return CurrentAllocator();
}

api::Result<void*> GlobalAllocator::Allocate(std::size_t size, std::size_t alignment) {
  return Current()->Allocate(size, alignment);
}

api::Status GlobalAllocator::Deallocate(void* ptr, std::size_t size) {
  return Current()->Deallocate(ptr, size);
}

AllocBackend GlobalAllocator::CurrentBackend() {
  std::lock_guard<std::mutex> lock(ConfigureMu());
  return GlobalOptions().backend;
}

const char* GlobalAllocator::CurrentBackendName() {
  std::lock_guard<std::mutex> lock(ConfigureMu());
  return CurrentAllocator()->BackendName();
}

AllocatorStats GlobalAllocator::CurrentStats() {
  std::lock_guard<std::mutex> lock(ConfigureMu());
  return CurrentAllocator()->Stats();
}

void GlobalAllocator::ResetCurrentStats() {
  std::lock_guard<std::mutex> lock(ConfigureMu());
  CurrentAllocator()->ResetStats();
}

const char* GlobalAllocator::BackendDisplayName(AllocBackend backend) {
  switch (backend) {
    case AllocBackend::kSystem:
      return "system";
    case AllocBackend::kMimalloc:
      return "mimalloc";
    case AllocBackend::kTbbScalable:
      return "tbb";
    default:
      return "unknown";
  }
}

bool GlobalAllocator::IsBackendEnabled(AllocBackend backend) {
  switch (backend) {
    case AllocBackend::kSystem:
      return true;
#if defined(POOLKIT_ENABLE_MIMALLOC_BACKEND)
    case AllocBackend::kMimalloc:
      return true;
#endif
#if defined(POOLKIT_ENABLE_TBBMALLOC_BACKEND)
    case AllocBackend::kTbbScalable:
      return true;
#endif
    default:
      return false;
  }
}

#undef PK_STATUS

}  // namespace memory
}  // namespace poolkit
