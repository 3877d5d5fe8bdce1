#include "memory/backend_allocators.hpp"

#if defined(POOLKIT_ENABLE_TBBMALLOC_BACKEND)

#include <tbb/scalable_allocator.h>

namespace poolkit {
namespace memory {

void* TbbAllocator::RawAllocate(std::size_t size, std::size_t alignment) {
  return scalable_aligned_malloc(size, alignment);
}

void TbbAllocator::RawFree(void* ptr) { scalable_aligned_free(ptr); }

}  // namespace memory
}  // namespace poolkit

#endif  // POOLKIT_ENABLE_TBBMALLOC_BACKEND
