/// @file random_source.cpp
/// @brief RandomSource factories.

#include "arc/game/random_source.hpp"

#include <memory>
#include <random>

namespace arc::game {

RandomSource makeRandomSource(uint32_t seed) {
    auto engine = std::make_shared<std::mt19937>(seed);
    return [engine]() {
        std::uniform_real_distribution<float> dist(0.0f, 1.0f);
        float value = dist(*engine);
        // uniform_real_distribution<float> may round up to the upper bound.
        return value < 1.0f ? value : 0.0f;
    };
}

RandomSource makeRandomSource() {
    std::random_device device;
    return makeRandomSource(device());
}

} // namespace arc::game
