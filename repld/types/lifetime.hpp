/*

  Lifetime objects that notify an observer when they are destroyed

  - lifetime_tagged_c : On death, the supplied tag is handed to the
      observer so it can tell which object went away

  Session handles embed one of these keyed by a per-handle serial so the
  registry learns when the last client reference to a handle is gone.
*/

#pragma once

#include <cstddef>

namespace repld::types {

class lifetime_tagged_c {
public:
  class observer_if {
  public:
    virtual ~observer_if() = default;
    virtual void death_ind(const std::size_t tag) = 0;
  };
  lifetime_tagged_c() = delete;
  lifetime_tagged_c(const lifetime_tagged_c &) = delete;
  lifetime_tagged_c &operator=(const lifetime_tagged_c &) = delete;

  constexpr lifetime_tagged_c(observer_if &obs, const std::size_t tag)
      : obs_(obs), tag_(tag) {}
  ~lifetime_tagged_c() { obs_.death_ind(tag_); }

  std::size_t get_tag() const { return tag_; }

private:
  observer_if &obs_;
  const std::size_t tag_{0};
};

} // namespace repld::types
