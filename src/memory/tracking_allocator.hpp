#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

#include "poolkit/memory/iallocator.hpp"

namespace poolkit {
namespace memory {

// Shared bookkeeping for all backends: argument checks plus alloc/free
// counters and live byte accounting. Backends only supply the raw calls.
// Lock-free; callers report the block size on free.
class TrackingAllocator : public IAllocator {
 public:
  ~TrackingAllocator() override;

  std::uint32_t ApiVersion() const override;
  AllocatorStats Stats() const override;
  void ResetStats() override;

  api::Result<void*> Allocate(std::size_t size, std::size_t alignment) override;
  api::Status Deallocate(void* ptr, std::size_t size) override;

 protected:
  TrackingAllocator();

  // Returns NULL on failure. Arguments are already validated.
  virtual void* RawAllocate(std::size_t size, std::size_t alignment) = 0;
  virtual void RawFree(void* ptr) = 0;

 private:
  void RecordAllocFailure();
  void RecordAllocSuccess(std::size_t size);
  void RecordDeallocate(std::size_t size);

  std::atomic<std::uint64_t> alloc_count_;
  std::atomic<std::uint64_t> free_count_;
  std::atomic<std::uint64_t> alloc_fail_count_;
  std::atomic<std::uint64_t> bytes_in_use_;
  std::atomic<std::uint64_t> bytes_peak_;
};

}  // namespace memory
}  // namespace poolkit
