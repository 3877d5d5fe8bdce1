#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "poolkit/api/export.hpp"
#include "poolkit/memory/iallocator.hpp"

namespace poolkit {
namespace memory {

struct GlobalAllocatorOptions {
  AllocBackend backend = AllocBackend::kSystem;
  // When false, a backend missing from this build falls back to kSystem.
  bool strict_backend = true;
};

// Process-wide memory source for pool storage (see GlobalStlAllocator).
// A pool binds to the backend that is current when the pool is built.
class POOLKIT_API GlobalAllocator {
 public:
  // Switch backend. Refused with kWouldBlock while the current backend still
  // has bytes in use.
  static api::Status Configure(const GlobalAllocatorOptions& options);

  // Load allocator policy from the "memory" section of a JSON config file:
  // {
  //   "memory": {
  //     "backend": "system|tbb|mimalloc",
  //     "strict_backend": true|false
  //   }
  // }
  // A file without a "memory" section leaves the current policy unchanged.
  static api::Status ConfigureFromFile(const std::string& config_path);

  // Backend in effect right now. Holders keep it alive across a later
  // Configure, so blocks are always freed by the backend that made them.
  static std::shared_ptr<IAllocator> Current();

  // One-off blocks from the current backend. size must match on Deallocate.
  static api::Result<void*> Allocate(std::size_t size, std::size_t alignment);
  static api::Status Deallocate(void* ptr, std::size_t size);

  static AllocBackend CurrentBackend();
  static const char* CurrentBackendName();
  static AllocatorStats CurrentStats();
  static void ResetCurrentStats();

  static const char* BackendDisplayName(AllocBackend backend);
  static bool IsBackendEnabled(AllocBackend backend);
};

}  // namespace memory
}  // namespace poolkit
