// Random number generation utilities for deterministic sound generation.

#ifndef SHAPESOUND_CORE_RNG_UTIL_H
#define SHAPESOUND_CORE_RNG_UTIL_H

#include <cstdint>
#include <random>

namespace shapesound {
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

/// @brief Splitmix32 hash for decorrelating per-index sub-seeds.
///
/// Produces a well-distributed 32-bit hash from a seed+index pair.
/// Each noise layer of a session derives its own seed this way, so two
/// layers never share a noise buffer while the whole session stays
/// reproducible from one seed.
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
}  // namespace shapesound

#endif  // SHAPESOUND_CORE_RNG_UTIL_H
