#include "memory/backend_allocators.hpp"

#if defined(POOLKIT_ENABLE_MIMALLOC_BACKEND)

#include <mimalloc.h>

namespace poolkit {
namespace memory {

void* MimallocAllocator::RawAllocate(std::size_t size, std::size_t alignment) {
  return mi_malloc_aligned(size, alignment);
}

void MimallocAllocator::RawFree(void* ptr) { mi_free(ptr); }

}  // namespace memory
}  // namespace poolkit

#endif  // POOLKIT_ENABLE_MIMALLOC_BACKEND
