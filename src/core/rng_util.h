// Random number generation utilities for deterministic design generation.

#ifndef IPED_CORE_RNG_UTIL_H
#define IPED_CORE_RNG_UTIL_H

#include <cstddef>
#include <cstdint>
#include <random>
#include <utility>
#include <vector>

namespace iped {
namespace rng {

/// @brief Generate a random integer in [min, max] inclusive.
/// @param rng Mersenne Twister RNG instance.
/// @param min Minimum value (inclusive).
/// @param max Maximum value (inclusive).
/// @return Random integer in the specified range.
inline int rollRange(std::mt19937& rng, int min, int max) {
  std::uniform_int_distribution<int> dist(min, max);
  return dist(rng);
}

/// @brief Select a random index from a container.
/// @tparam Container Container type with size().
/// @param rng Mersenne Twister RNG instance.
/// @param container Non-empty container.
/// @return Random index in [0, container.size() - 1].
template <typename Container>
inline size_t selectRandomIndex(std::mt19937& rng, const Container& container) {
  std::uniform_int_distribution<size_t> dist(0, container.size() - 1);
  return dist(rng);
}

/// @brief Fisher-Yates shuffle driven by rollRange.
///
/// Used instead of std::shuffle so the permutation only depends on the
/// uniform_int_distribution draws made here.
///
/// @param rng Mersenne Twister RNG instance.
/// @param values Vector to permute in place.
template <typename T>
inline void shuffleInPlace(std::mt19937& rng, std::vector<T>& values) {
  for (size_t idx = values.size(); idx > 1; --idx) {
    int swap_with = rollRange(rng, 0, static_cast<int>(idx) - 1);
    std::swap(values[idx - 1], values[static_cast<size_t>(swap_with)]);
  }
}

/// @brief Splitmix32 hash for decorrelating per-index sub-seeds.
///
/// Produces a well-distributed 32-bit hash from a seed+index pair.
/// Use this instead of `seed + idx * constant` for better decorrelation
/// between close seed values (e.g. per-respondent generators).
///
/// @param seed Base seed value.
/// @param index Sub-seed index.
/// @return Decorrelated 32-bit hash.
inline uint32_t splitmix32(uint32_t seed, uint32_t index) {
  uint32_t z = seed + index * 0x9E3779B9u;
  z = (z ^ (z >> 16)) * 0x85EBCA6Bu;
  z = (z ^ (z >> 13)) * 0xC2B2AE35u;
  return z ^ (z >> 16);
}

/// @brief Generate a random seed using the system random device.
/// @return A non-zero random seed (suitable for seeding mt19937).
inline uint32_t generateRandomSeed() {
  std::random_device device;
  uint32_t result = device();
  if (result == 0) result = 1;
  return result;
}

}  // namespace rng
}  // namespace iped

#endif  // IPED_CORE_RNG_UTIL_H
