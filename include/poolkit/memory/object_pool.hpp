#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <new>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <glog/logging.h>

#include "poolkit/api/status.hpp"
#include "poolkit/memory/global_stl_allocator.hpp"
#include "poolkit/memory/pool_options.hpp"
#include "poolkit/memory/sanitizer.hpp"

namespace poolkit {
namespace memory {

template <typename T, typename S>
class ObjectPool;

struct PoolStats {
  std::uint64_t created = 0;    // values produced by an initializer
  std::uint64_t reused = 0;     // acquisitions served from storage
  std::uint64_t recycled = 0;   // releases pushed back into storage
  std::uint64_t discarded = 0;  // releases rejected by the sanitizer or by a failed push
  std::uint64_t truncated = 0;  // stored values dropped by Truncate/Clear
};

// Owning handle for one value borrowed from an ObjectPool.
//
// States: Active (holds a value and a pool) and Spent (holds neither).
// Detach() hands the value to the caller; Recycle() or destruction sanitizes
// it and returns it to the pool. Either one makes the handle Spent, and
// Spent is terminal. Move-only; a moved-from handle is Spent.
template <typename T, typename S = Sanitizer<T> >
class Pooled {
 public:
  typedef ObjectPool<T, S> Pool;

  Pooled(Pooled&& other) noexcept(std::is_nothrow_move_constructible<T>::value)
      : pool_(other.pool_), value_(std::move(other.value_)) {
    other.pool_ = NULL;
    other.value_.reset();
  }

  Pooled& operator=(Pooled&& other) noexcept(std::is_nothrow_move_constructible<T>::value &&
                                             std::is_nothrow_move_assignable<T>::value) {
    if (this != &other) {
      Recycle();
      pool_ = other.pool_;
      value_ = std::move(other.value_);
      other.pool_ = NULL;
      other.value_.reset();
    }
    return *this;
  }

  Pooled(const Pooled&) = delete;
  Pooled& operator=(const Pooled&) = delete;

  ~Pooled() { Recycle(); }

  T& operator*() {
    DCHECK(value_.has_value()) << "dereferencing a spent pooled handle";
    return *value_;
  }
  const T& operator*() const {
    DCHECK(value_.has_value()) << "dereferencing a spent pooled handle";
    return *value_;
  }
  T* operator->() { return &**this; }
  const T* operator->() const { return &**this; }
  T* get() { return value_.has_value() ? &*value_ : NULL; }
  const T* get() const { return value_.has_value() ? &*value_ : NULL; }

  bool spent() const { return pool_ == NULL; }

  // Take the value out for good; it will never go back to the pool.
  // Calling this on a spent handle is a programmer error and aborts.
  T Detach() {
    CHECK(pool_ != NULL && value_.has_value()) << "Detach() on a spent pooled handle";
    pool_ = NULL;
    T out(std::move(*value_));
    value_.reset();
    return out;
  }

  // Return the value to the pool now. No-op on a spent handle.
  void Recycle() {
    if (pool_ == NULL) return;
    Pool* pool = pool_;
    pool_ = NULL;
    T value(std::move(*value_));
    value_.reset();
    pool->Release(std::move(value));
  }

 private:
  friend class ObjectPool<T, S>;

  Pooled(Pool* pool, T&& value) : pool_(pool), value_(std::move(value)) {}

  Pool* pool_;
  std::optional<T> value_;
};

// Thread-safe recycling pool of T values.
//
// Released values are sanitized by S (Sanitizer<T> by default) and kept in a
// LIFO stack; the next acquisition reuses the most recently released one.
// The lock only covers single storage mutations; initializers and sanitizers
// always run outside it.
//
// The pool must outlive every Pooled handle it hands out.
template <typename T, typename S = Sanitizer<T> >
class ObjectPool {
 public:
  typedef T value_type;
  typedef Pooled<T, S> Handle;

  ObjectPool() {}

  explicit ObjectPool(std::size_t capacity) { storage_.reserve(capacity); }

  explicit ObjectPool(const ObjectPoolOptions& options) : name_(options.name) {
    storage_.reserve(options.initial_capacity);
  }

  ObjectPool(const ObjectPool&) = delete;
  ObjectPool& operator=(const ObjectPool&) = delete;

  ~ObjectPool() {}

  const std::string& name() const { return name_; }

  // Reuse the most recently released value, or call init() when storage is
  // empty. Anything init() throws propagates; the pool is left untouched.
  template <typename Init>
  Handle AcquireOrInit(Init&& init) {
    std::optional<T> reused = PopMostRecent();
    if (reused.has_value()) {
      reused_.fetch_add(1, std::memory_order_relaxed);
      return Handle(this, std::move(*reused));
    }
    T fresh(init());
    created_.fetch_add(1, std::memory_order_relaxed);
    return Handle(this, std::move(fresh));
  }

  Handle AcquireOrDefault() {
    return AcquireOrInit([]() { return T(); });
  }

  // Adopt a value that did not come from this pool. Storage is not touched.
  Handle Construct(T value) { return Handle(this, std::move(value)); }

  // Drop stored values from index new_size onward. Safe to call while other
  // threads acquire and release. Dropped values are destroyed after the lock
  // is released, so their destructors may use this pool.
  void Truncate(std::size_t new_size) {
    Storage dropped(storage_.get_allocator());
    std::size_t want = 0;
    for (;;) {
      {
        std::lock_guard<std::mutex> lock(mu_);
        if (storage_.size() <= new_size) break;
        want = storage_.size() - new_size;
        if (dropped.capacity() >= want) {
          MoveTail(new_size, &dropped);
          break;
        }
      }
      // Grow the holding area outside the lock, then look again.
      if (!ReserveDropped(&dropped, want)) {
        std::size_t erased = 0;
        {
          std::lock_guard<std::mutex> lock(mu_);
          erased = EraseTail(new_size);
        }
        NoteTruncated(new_size, erased);
        return;
      }
    }
    NoteTruncated(new_size, dropped.size());
  }

  // Same as Truncate without taking the lock. The caller guarantees that no
  // other thread touches the pool for the duration of the call.
  void TruncateUnsynchronized(std::size_t new_size) {
    if (storage_.size() <= new_size) return;
    Storage dropped(storage_.get_allocator());
    if (!ReserveDropped(&dropped, storage_.size() - new_size)) {
      NoteTruncated(new_size, EraseTail(new_size));
      return;
    }
    MoveTail(new_size, &dropped);
    NoteTruncated(new_size, dropped.size());
  }

  void Clear() { Truncate(0); }
  void ClearUnsynchronized() { TruncateUnsynchronized(0); }

  std::size_t Size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return storage_.size();
  }

  std::size_t Capacity() const {
    std::lock_guard<std::mutex> lock(mu_);
    return storage_.capacity();
  }

  PoolStats Stats() const {
    PoolStats s;
    s.created = created_.load(std::memory_order_relaxed);
    s.reused = reused_.load(std::memory_order_relaxed);
    s.recycled = recycled_.load(std::memory_order_relaxed);
    s.discarded = discarded_.load(std::memory_order_relaxed);
    s.truncated = truncated_.load(std::memory_order_relaxed);
    return s;
  }

 private:
  friend class Pooled<T, S>;

  typedef std::vector<T, GlobalStlAllocator<T> > Storage;

  // Called by Pooled once it has given up the value.
  void Release(T&& value) {
    if (!S::Apply(&value)) {
      discarded_.fetch_add(1, std::memory_order_relaxed);
      return;
    }
    api::Status st = PushBack(std::move(value));
    if (!st.ok()) {
      discarded_.fetch_add(1, std::memory_order_relaxed);
      LOG(WARNING) << name_ << ": dropping released value, " << st.ToString();
      return;
    }
    recycled_.fetch_add(1, std::memory_order_relaxed);
  }

  api::Status PushBack(T&& value) {
    std::lock_guard<std::mutex> lock(mu_);
    try {
      storage_.push_back(std::move(value));
    } catch (const std::bad_alloc&) {
      return api::Status::FromModule(api::StatusCode::kInternalError,
                                     "pool storage allocation failed", api::ErrorModule::kPool,
                                     0x0001);
    }
    return api::Status::Ok();
  }

  std::optional<T> PopMostRecent() {
    std::lock_guard<std::mutex> lock(mu_);
    if (storage_.empty()) {
      return std::nullopt;
    }
    std::optional<T> out(std::move(storage_.back()));
    storage_.pop_back();
    return out;
  }

  // Moves storage_[new_size..] into *dropped, whose capacity is already
  // enough, and shrinks storage_. Only moved-from shells die here.
  void MoveTail(std::size_t new_size, Storage* dropped) {
    for (std::size_t i = new_size; i < storage_.size(); ++i) {
      dropped->push_back(std::move(storage_[i]));
    }
    EraseTail(new_size);
  }

  bool ReserveDropped(Storage* dropped, std::size_t count) {
    try {
      dropped->reserve(count);
    } catch (const std::bad_alloc&) {
      LOG(WARNING) << name_ << ": no room to stage truncated values, dropping them in place";
      return false;
    }
    return true;
  }

  std::size_t EraseTail(std::size_t new_size) {
    if (storage_.size() <= new_size) return 0;
    const std::size_t count = storage_.size() - new_size;
    storage_.erase(storage_.begin() + static_cast<std::ptrdiff_t>(new_size), storage_.end());
    return count;
  }

  void NoteTruncated(std::size_t new_size, std::size_t count) {
    if (count == 0) return;
    truncated_.fetch_add(count, std::memory_order_relaxed);
    VLOG(1) << name_ << ": truncated to " << new_size << ", dropped " << count;
  }

  std::string name_ = "poolkit.memory.object_pool";
  mutable std::mutex mu_;
  Storage storage_;

  std::atomic<std::uint64_t> created_{0};
  std::atomic<std::uint64_t> reused_{0};
  std::atomic<std::uint64_t> recycled_{0};
  std::atomic<std::uint64_t> discarded_{0};
  std::atomic<std::uint64_t> truncated_{0};
};

}  // namespace memory
}  // namespace poolkit
