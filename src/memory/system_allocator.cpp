#include "memory/backend_allocators.hpp"

#include <cstdlib>

#if defined(_WIN32)
#include <malloc.h>
#endif

namespace poolkit {
namespace memory {

void* SystemAllocator::RawAllocate(std::size_t size, std::size_t alignment) {
#if defined(_WIN32)
  return _aligned_malloc(size, alignment);
#else
  void* ptr = NULL;
  if (posix_memalign(&ptr, alignment, size) != 0) {
    return NULL;
  }
  return ptr;
#endif
}

void SystemAllocator::RawFree(void* ptr) {
#if defined(_WIN32)
  _aligned_free(ptr);
#else
  std::free(ptr);
#endif
}

}  // namespace memory
}  // namespace poolkit
