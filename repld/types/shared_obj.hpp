/*
  Intrusive reference counting for objects handed out to remote callers.
  Smaller than std::shared_ptr and lets the object itself decide what
  happens on its last release (session handles tell the registry).
  The count is atomic since handles cross caller threads.
*/

#pragma once

#include <atomic>
#include <cstdint>
#include <utility>

namespace repld::types {

//! \brief Something that will be reference counted
class shared_c {
public:
  shared_c() {}
  virtual ~shared_c() {}

  shared_c(const shared_c &) = delete;
  shared_c &operator=(const shared_c &) = delete;

  void acquire() const { ref_count_.fetch_add(1, std::memory_order_relaxed); }
  std::int64_t release() const {
    return ref_count_.fetch_sub(1, std::memory_order_acq_rel) - 1;
  }
  std::int64_t ref_count() const {
    return ref_count_.load(std::memory_order_acquire);
  }

private:
  mutable std::atomic<std::int64_t> ref_count_{0};
};

//! \brief A wrapper that performs operations
//!        for and around a reference counted object
template <class T> class shared_obj_c {
public:
  shared_obj_c() {}

  shared_obj_c(T *object) { acquire(object); }

  shared_obj_c(const shared_obj_c &rhs) { acquire(rhs.object_); }

  shared_obj_c(shared_obj_c &&rhs) noexcept
      : object_(std::exchange(rhs.object_, nullptr)) {}

  shared_obj_c &operator=(const shared_obj_c &rhs) {
    if (this != &rhs) {
      acquire(rhs.object_);
    }
    return *this;
  }

  shared_obj_c &operator=(shared_obj_c &&rhs) noexcept {
    if (this != &rhs) {
      release();
      object_ = std::exchange(rhs.object_, nullptr);
    }
    return *this;
  }

  ~shared_obj_c() { release(); }

  T &operator*() const { return *object_; }
  T *operator->() const { return object_; }
  T *get() const { return object_; }

  bool operator==(const shared_obj_c &rhs) const {
    return object_ == rhs.object_;
  }
  bool operator!=(const shared_obj_c &rhs) const {
    return object_ != rhs.object_;
  }

  explicit operator bool() const { return object_ != nullptr; }

  //! \brief Drop this reference early
  void reset() { release(); }

private:
  void acquire(T *object) {
    if (object != nullptr) {
      object->acquire();
    }
    release();
    object_ = object;
  }

  void release() {
    T *object = std::exchange(object_, nullptr);
    if (object != nullptr && object->release() == 0) {
      delete object;
    }
  }

  T *object_{nullptr};
};

} // namespace repld::types
