#pragma once

#include "memory/tracking_allocator.hpp"

namespace poolkit {
namespace memory {

// posix_memalign / _aligned_malloc.
class SystemAllocator : public TrackingAllocator {
 public:
  const char* Name() const override { return "poolkit.memory.system_allocator"; }
  const char* BackendName() const override { return "system"; }

 protected:
  void* RawAllocate(std::size_t size, std::size_t alignment) override;
  void RawFree(void* ptr) override;
};

#if defined(POOLKIT_ENABLE_TBBMALLOC_BACKEND)
// oneTBB scalable allocator (tbbmalloc).
class TbbAllocator : public TrackingAllocator {
 public:
  const char* Name() const override { return "poolkit.memory.tbb_allocator"; }
  const char* BackendName() const override { return "tbb"; }

 protected:
  void* RawAllocate(std::size_t size, std::size_t alignment) override;
  void RawFree(void* ptr) override;
};
#endif

#if defined(POOLKIT_ENABLE_MIMALLOC_BACKEND)
class MimallocAllocator : public TrackingAllocator {
 public:
  const char* Name() const override { return "poolkit.memory.mimalloc_allocator"; }
  const char* BackendName() const override { return "mimalloc"; }

 protected:
  void* RawAllocate(std::size_t size, std::size_t alignment) override;
  void RawFree(void* ptr) override;
};
#endif

}  // namespace memory
}  // namespace poolkit
