#pragma once

#include <cstdint>
#include <random>

namespace facade_generator {
namespace utils {

/**
 * Random - explicit, per-branch deterministic RNG.
 *
 * Each generation branch constructs its own instance from a derived seed and
 * passes it by reference; there is no shared global state.
 *
 * std::mt19937 output is fully specified by the standard, but the standard
 * distributions are not, so floats are built directly from engine output
 * (53-bit construction from two 32-bit draws) to keep sequences identical
 * across standard library implementations.
 */
class Random {
public:
    explicit Random(uint32_t seed) : engine_(seed), seed_(seed) {}

    uint32_t getSeed() const { return seed_; }

    // Uniform in [0, 1)
    double getFloat() {
        uint64_t a = engine_() >> 5;
        uint64_t b = engine_() >> 6;
        return (static_cast<double>(a) * 67108864.0 + static_cast<double>(b)) *
               (1.0 / 9007199254740992.0);
    }

    // Uniform in [minVal, maxVal)
    double uniform(double minVal, double maxVal) {
        return minVal + (maxVal - minVal) * getFloat();
    }

    // Uniform in [0, maxVal), 0 when maxVal is 0
    uint32_t getInt(uint32_t maxVal) {
        if (maxVal == 0) return 0;
        uint32_t v = static_cast<uint32_t>(getFloat() * maxVal);
        return v < maxVal ? v : maxVal - 1;
    }

    bool getBool(double chance = 0.5) {
        return getFloat() < chance;
    }

    std::mt19937& engine() { return engine_; }

private:
    std::mt19937 engine_;
    uint32_t seed_;
};

} // namespace utils
} // namespace facade_generator
