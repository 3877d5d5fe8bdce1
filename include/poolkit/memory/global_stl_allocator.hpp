#pragma once

#include <cstddef>
#include <limits>
#include <memory>
#include <new>

#include "poolkit/memory/global_allocator.hpp"
#include "poolkit/memory/iallocator.hpp"

namespace poolkit {
namespace memory {

// std-compatible allocator drawing from GlobalAllocator. Used for pool storage.
// Holds the backend that was current at construction, so a container keeps
// its backend alive and frees into it even after GlobalAllocator is
// reconfigured or torn down.
template <typename T>
class GlobalStlAllocator {
 public:
  typedef T value_type;

  GlobalStlAllocator() : backend_(GlobalAllocator::Current()) {}
  // No move constructor: a moved-from allocator must still equal its copy.
  GlobalStlAllocator(const GlobalStlAllocator& other) noexcept : backend_(other.backend_) {}
  GlobalStlAllocator& operator=(const GlobalStlAllocator& other) noexcept {
    backend_ = other.backend_;
    return *this;
  }
  template <typename U>
  GlobalStlAllocator(const GlobalStlAllocator<U>& other) noexcept : backend_(other.backend()) {}

  T* allocate(std::size_t n) {
    if (n == 0) return NULL;
    if (n > (std::numeric_limits<std::size_t>::max() / sizeof(T))) {
      throw std::bad_alloc();
    }
    const std::size_t alignment = alignof(T) < sizeof(void*) ? sizeof(void*) : alignof(T);
    api::Result<void*> r = backend_->Allocate(n * sizeof(T), alignment);
    if (!r.ok() || r.value() == NULL) {
      throw std::bad_alloc();
    }
    return static_cast<T*>(r.value());
  }

  void deallocate(T* p, std::size_t n) noexcept {
    (void)backend_->Deallocate(static_cast<void*>(p), n * sizeof(T));
  }

  const std::shared_ptr<IAllocator>& backend() const noexcept { return backend_; }

  template <typename U>
  struct rebind {
    typedef GlobalStlAllocator<U> other;
  };

 private:
  std::shared_ptr<IAllocator> backend_;
};

template <typename T, typename U>
bool operator==(const GlobalStlAllocator<T>& a, const GlobalStlAllocator<U>& b) noexcept {
  return a.backend() == b.backend();
}

template <typename T, typename U>
bool operator!=(const GlobalStlAllocator<T>& a, const GlobalStlAllocator<U>& b) noexcept {
  return !(a == b);
}

}  // namespace memory
}  // namespace poolkit
