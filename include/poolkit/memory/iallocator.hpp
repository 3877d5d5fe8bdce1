#pragma once

#include <cstddef>
#include <cstdint>

#include "poolkit/api/status.hpp"
#include "poolkit/api/version.hpp"

namespace poolkit {
namespace memory {

enum class AllocBackend { kSystem = 0, kTbbScalable = 1, kMimalloc = 2 };

struct AllocatorStats {
  std::uint64_t alloc_count = 0;
  std::uint64_t free_count = 0;
  std::uint64_t alloc_fail_count = 0;
  std::uint64_t bytes_in_use = 0;
  std::uint64_t bytes_peak = 0;
};

// Raw memory source behind pool storage. Implementations are thread safe.
class IAllocator {
 public:
  virtual ~IAllocator() {}

  // Implementation name, e.g. "poolkit.memory.tbb_allocator".
  virtual const char* Name() const = 0;

  // Short backend name as used in configuration ("system", "tbb", "mimalloc").
  virtual const char* BackendName() const = 0;

  virtual std::uint32_t ApiVersion() const = 0;

  virtual AllocatorStats Stats() const = 0;
  virtual void ResetStats() = 0;

  // Allocate an aligned block.
  // - size must be > 0.
  // - alignment must be a power of two and >= sizeof(void*).
  // Returns kInvalidArgument on bad input, kInternalError when the backend fails.
  virtual api::Result<void*> Allocate(std::size_t size, std::size_t alignment) = 0;

  // Release a block returned by Allocate on the same instance. size must be
  // the size passed to Allocate. NULL is a no-op.
  virtual api::Status Deallocate(void* ptr, std::size_t size) = 0;
};

}  // namespace memory
}  // namespace poolkit
