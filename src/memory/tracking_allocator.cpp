#include "memory/tracking_allocator.hpp"

namespace poolkit {
namespace memory {

#define PK_STATUS(code, message) \
  api::Status::FromModule((code), (message), api::ErrorModule::kMemory, 0x0001)

namespace {

bool IsPowerOfTwo(std::size_t x) { return x != 0 && (x & (x - 1)) == 0; }

}  // namespace

TrackingAllocator::TrackingAllocator()
    : alloc_count_(0), free_count_(0), alloc_fail_count_(0), bytes_in_use_(0), bytes_peak_(0) {}
TrackingAllocator::~TrackingAllocator() {}

std::uint32_t TrackingAllocator::ApiVersion() const { return api::kApiVersion; }

AllocatorStats TrackingAllocator::Stats() const {
  AllocatorStats s;
  s.alloc_count = alloc_count_.load(std::memory_order_relaxed);
  s.free_count = free_count_.load(std::memory_order_relaxed);
  s.alloc_fail_count = alloc_fail_count_.load(std::memory_order_relaxed);
  s.bytes_in_use = bytes_in_use_.load(std::memory_order_relaxed);
  s.bytes_peak = bytes_peak_.load(std::memory_order_relaxed);
  return s;
}

void TrackingAllocator::ResetStats() {
  // Live bytes stay: the blocks behind them are still owned by callers.
  const std::uint64_t live = bytes_in_use_.load(std::memory_order_relaxed);
  alloc_count_.store(0, std::memory_order_relaxed);
  free_count_.store(0, std::memory_order_relaxed);
  alloc_fail_count_.store(0, std::memory_order_relaxed);
  bytes_peak_.store(live, std::memory_order_relaxed);
}

api::Result<void*> TrackingAllocator::Allocate(std::size_t size, std::size_t alignment) {
  if (size == 0) {
    RecordAllocFailure();
    return api::Result<void*>(api::Status::FromModule(
        api::StatusCode::kInvalidArgument, "size must be > 0", api::ErrorModule::kMemory));
  }
  if (alignment < sizeof(void*) || !IsPowerOfTwo(alignment)) {
    RecordAllocFailure();
    return api::Result<void*>(PK_STATUS(api::StatusCode::kInvalidArgument,
                                        "alignment must be power-of-two and >= sizeof(void*)"));
  }

  void* ptr = RawAllocate(size, alignment);
  if (ptr == NULL) {
    RecordAllocFailure();
    return api::Result<void*>(
        PK_STATUS(api::StatusCode::kInternalError, std::string(BackendName()) + " allocation failed"));
  }
  RecordAllocSuccess(size);
  return api::Result<void*>(ptr);
}

api::Status TrackingAllocator::Deallocate(void* ptr, std::size_t size) {
  if (ptr == NULL) return api::Status::Ok();
  RecordDeallocate(size);
  RawFree(ptr);
  return api::Status::Ok();
}

void TrackingAllocator::RecordAllocFailure() {
  alloc_fail_count_.fetch_add(1, std::memory_order_relaxed);
}

void TrackingAllocator::RecordAllocSuccess(std::size_t size) {
  alloc_count_.fetch_add(1, std::memory_order_relaxed);
  const std::uint64_t in_use_now =
      bytes_in_use_.fetch_add(static_cast<std::uint64_t>(size), std::memory_order_relaxed) +
      static_cast<std::uint64_t>(size);

  std::uint64_t peak = bytes_peak_.load(std::memory_order_relaxed);
  while (in_use_now > peak &&
         !bytes_peak_.compare_exchange_weak(peak, in_use_now, std::memory_order_relaxed,
                                            std::memory_order_relaxed)) {
  }
}

void TrackingAllocator::RecordDeallocate(std::size_t size) {
  free_count_.fetch_add(1, std::memory_order_relaxed);
  const std::uint64_t delta = static_cast<std::uint64_t>(size);
  std::uint64_t cur = bytes_in_use_.load(std::memory_order_relaxed);
  while (true) {
    const std::uint64_t next = cur > delta ? (cur - delta) : 0;
    if (bytes_in_use_.compare_exchange_weak(cur, next, std::memory_order_relaxed,
                                            std::memory_order_relaxed)) {
      break;
    }
  }
}

#undef PK_STATUS

}  // namespace memory
}  // namespace poolkit
