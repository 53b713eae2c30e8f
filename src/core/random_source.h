/**
 * @file random_source.h
 * @brief Seedable random numbers for serve direction and AI mistakes
 */

#pragma once

#include <cstdint>
#include <random>

namespace pongsim {

/**
 * @brief Thin wrapper over a Mersenne Twister
 *
 * One instance is shared by the ball (serve direction) and the AI
 * (accuracy rolls, prediction error). Tests construct it with a fixed
 * seed so runs are repeatable.
 */
class RandomSource {
public:
    RandomSource() : engine(std::random_device{}()) {}
    explicit RandomSource(std::uint32_t seed) : engine(seed) {}

    /// Uniform in [0, 1)
    double uniform01() { return std::uniform_real_distribution<double>(0.0, 1.0)(engine); }

    /// Uniform in [lo, hi)
    double uniform(double lo, double hi) { return std::uniform_real_distribution<double>(lo, hi)(engine); }

    /// true with probability p
    bool chance(double p) { return uniform01() < p; }

    void reseed(std::uint32_t seed) { engine.seed(seed); }

private:
    std::mt19937 engine;
};

} // namespace pongsim
