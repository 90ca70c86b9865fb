#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace facade_generator {
namespace utils {

/**
 * SeedDeriver - derive independent child seeds from a parent seed.
 *
 * derive(parent, ids...) is a pure function of the parent seed and the
 * ordered identifiers. The byte stream fed to the hash is fixed (tagged,
 * little-endian), so results are the same on every platform and compiler:
 *
 *   'S' + parent (4 bytes)
 *   'i' + int64 value (8 bytes)           for each integer identifier
 *   's' + length (8 bytes) + raw bytes    for each string identifier
 *
 * The stream is hashed with 64-bit FNV-1a, run through the SplitMix64
 * finalizer, folded to 32 bits and masked into [0, 2^31).
 *
 * Example:
 *   uint32_t floorSeed = SeedDeriver::derive(buildingSeed, "floor", 2);
 *   uint32_t doorSeed  = SeedDeriver::derive(floorSeed, "door", 0);
 */
class SeedDeriver {
public:
    static constexpr uint32_t kSeedMask = 0x7FFFFFFFu;

    template <typename... Ids>
    static uint32_t derive(uint32_t parent, const Ids&... ids) {
        uint64_t h = kFnvOffset;
        h = mixByte(h, 'S');
        h = mixBytes(h, parent, 4);
        (mixIdentifier(h, ids), ...);
        return finalize(h);
    }

    // derive(seed, i) for i in [0, count)
    static std::vector<uint32_t> split(uint32_t seed, size_t count);

private:
    static constexpr uint64_t kFnvOffset = 14695981039346656037ull;
    static constexpr uint64_t kFnvPrime = 1099511628211ull;

    static uint64_t mixByte(uint64_t h, uint8_t byte) {
        h ^= byte;
        h *= kFnvPrime;
        return h;
    }

    // Little-endian, independent of host byte order
    static uint64_t mixBytes(uint64_t h, uint64_t value, int count) {
        for (int i = 0; i < count; ++i) {
            h = mixByte(h, static_cast<uint8_t>((value >> (8 * i)) & 0xFFu));
        }
        return h;
    }

    static void mixIdentifier(uint64_t& h, std::string_view id) {
        h = mixByte(h, 's');
        h = mixBytes(h, static_cast<uint64_t>(id.size()), 8);
        for (char c : id) {
            h = mixByte(h, static_cast<uint8_t>(c));
        }
    }

    static void mixIdentifier(uint64_t& h, const std::string& id) {
        mixIdentifier(h, std::string_view(id));
    }

    static void mixIdentifier(uint64_t& h, const char* id) {
        mixIdentifier(h, std::string_view(id));
    }

    template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
    static void mixIdentifier(uint64_t& h, T id) {
        h = mixByte(h, 'i');
        h = mixBytes(h, static_cast<uint64_t>(static_cast<int64_t>(id)), 8);
    }

    static uint32_t finalize(uint64_t h);
};

} // namespace utils
} // namespace facade_generator
