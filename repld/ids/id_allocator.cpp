#include "ids/id_allocator.hpp"
#include <limits>

namespace repld::ids {

id_allocator_c::id_allocator_c(id_t start, std::optional<std::uint64_t> seed)
    : counter_(static_cast<std::uint32_t>(start)), rng_(seed) {}

id_t id_allocator_c::next_id(const check_fn_t &check) {
  id_t candidate = advance(1);
  std::size_t attempts_left = MAX_ATTEMPTS;

  while (candidate <= 0 || !check(candidate)) {
    if (--attempts_left == 0) {
      throw allocation_exhausted_exception("Invalid state or algorithm error");
    }
    candidate = advance(random_jump());
  }
  return candidate;
}

id_t id_allocator_c::current() const {
  return static_cast<id_t>(counter_.load());
}

void id_allocator_c::reset(id_t start) {
  counter_.store(static_cast<std::uint32_t>(start));
}

// Unsigned arithmetic so the wrap is well defined
id_t id_allocator_c::advance(std::uint32_t offset) {
  return static_cast<id_t>(counter_.fetch_add(offset) + offset);
}

std::uint32_t id_allocator_c::random_jump() {
  std::lock_guard<std::mutex> lock(rng_mutex_);
  return rng_.get_range(
      2, static_cast<std::uint32_t>(std::numeric_limits<id_t>::max()));
}

} // namespace repld::ids
