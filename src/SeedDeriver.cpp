#include "facade_generator/utils/SeedDeriver.hpp"

namespace facade_generator {
namespace utils {

uint32_t SeedDeriver::finalize(uint64_t h) {
    // SplitMix64 finalizer for avalanche
    h ^= h >> 30;
    h *= 0xBF58476D1CE4E5B9ull;
    h ^= h >> 27;
    h *= 0x94D049BB133111EBull;
    h ^= h >> 31;

    uint32_t folded = static_cast<uint32_t>(h ^ (h >> 32));
    return folded & kSeedMask;
}

std::vector<uint32_t> SeedDeriver::split(uint32_t seed, size_t count) {
    std::vector<uint32_t> seeds;
    seeds.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        seeds.push_back(derive(seed, i));
    }
    return seeds;
}

} // namespace utils
} // namespace facade_generator
