#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <random/generator.hpp>
#include <stdexcept>

namespace repld::ids {

using id_t = std::int32_t;

//! \brief Raised when no candidate passed the uniqueness check within the
//!        retry bound. Means the check or the counter is broken.
class allocation_exhausted_exception : public std::logic_error {
public:
  explicit allocation_exhausted_exception(const std::string &msg)
      : std::logic_error(msg) {}
};

/*
  Hands out positive ids from a shared counter.

  The counter only moves forward (wrapping at the int32 boundary). A
  rejected candidate is most likely the result of a wrap landing on a
  live id, so instead of stepping by one the counter jumps by a random
  offset, away from the cluster of live ids.
*/
class id_allocator_c {
public:
  static constexpr std::size_t MAX_ATTEMPTS = 100;

  using check_fn_t = std::function<bool(id_t)>;

  id_allocator_c(const id_allocator_c &) = delete;
  id_allocator_c &operator=(const id_allocator_c &) = delete;

  explicit id_allocator_c(id_t start = 0,
                          std::optional<std::uint64_t> seed = std::nullopt);
  ~id_allocator_c() = default;

  //! \brief Produce the next id accepted by check
  //! \param check Returns true if the candidate is free
  //! \throws allocation_exhausted_exception after MAX_ATTEMPTS rejections
  id_t next_id(const check_fn_t &check);

  id_t current() const;

  //! \brief Move the counter back to start; the next id tried is start + 1
  void reset(id_t start);

private:
  id_t advance(std::uint32_t offset);
  std::uint32_t random_jump();

  std::atomic<std::uint32_t> counter_;
  std::mutex rng_mutex_;
  random::generate_random_c<std::uint32_t> rng_;
};

} // namespace repld::ids
