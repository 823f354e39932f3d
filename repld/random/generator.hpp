#pragma once

#include <cstdint>
#include <optional>
#include <random>

namespace repld::random {

//! \brief  Generator for random integral values
//! \tparam T Given integral type that the generator should supply upon the
//!         call to get_range
template <typename T> class generate_random_c {
public:
  //! \brief Setup the object, seeding from the random device unless a
  //!        fixed seed is supplied
  explicit generate_random_c(std::optional<std::uint64_t> seed = std::nullopt)
      : eng(seed.has_value() ? static_cast<std::mt19937_64::result_type>(*seed)
                             : rd()) {}

  //! \brief     Get a numerical value within a specified range
  //! \param min Minimum value
  //! \param max Maximum Value
  //! \return    Return the randomly generated type T value
  T get_range(T min, T max) {
    std::uniform_int_distribution<T> dist(min, max);
    return dist(eng);
  }

private:
  std::random_device rd;
  std::mt19937_64 eng;
};

} // namespace repld::random
