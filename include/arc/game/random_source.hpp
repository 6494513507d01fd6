#pragma once

/// @file random_source.hpp
/// @brief Injectable uniform random source.

#include <cstdint>
#include <functional>

namespace arc::game {

/// Returns a value in [0, 1) on every call.
using RandomSource = std::function<float()>;

/// Mersenne-twister backed source. A fixed seed gives a reproducible stream.
[[nodiscard]] RandomSource makeRandomSource(uint32_t seed);

/// Source seeded from std::random_device.
[[nodiscard]] RandomSource makeRandomSource();

} // namespace arc::game
