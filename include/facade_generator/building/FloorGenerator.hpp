#pragma once

#include "facade_generator/GenerationConfig.hpp"
#include "facade_generator/geom/Footprint.hpp"
#include "facade_generator/placement/Elements.hpp"
#include "facade_generator/placement/PropertyGenerators.hpp"
#include <cstdint>

namespace facade_generator {
namespace building {

// Per-run diagnostics alongside the generated bundle
struct FloorGenerationStats {
    size_t doorsRequested = 0;
    size_t windowsRequested = 0;
    size_t droppedDoors = 0;
    size_t droppedWindows = 0;
};

/**
 * FloorGenerator - runs the door, window and corner policies for one floor.
 *
 * The floor seed is split into three branch seeds ("doors", "windows",
 * "corners") so adding or removing elements of one type never shifts the
 * random sequence of another. Doors go first and their occupancy map is
 * handed to the window policy; corners come last.
 */
class FloorGenerator {
public:
    FloorGenerator() : generators_(placement::ElementPropertyGenerators::defaults()) {}
    explicit FloorGenerator(const placement::ElementPropertyGenerators& generators)
        : generators_(generators.resolved()) {}

    placement::FloorElements generate(const geom::Footprint& footprint, int floorIndex,
                                      uint32_t seed, const GenerationConfig& config,
                                      FloorGenerationStats* stats = nullptr) const;

    const placement::ElementPropertyGenerators& generators() const { return generators_; }

private:
    placement::ElementPropertyGenerators generators_;
};

} // namespace building
} // namespace facade_generator
