#include "facade_generator/building/FloorGenerator.hpp"
#include "facade_generator/placement/Policies.hpp"
#include "facade_generator/utils/SeedDeriver.hpp"
#include <SDL3/SDL_log.h>
#include <utility>

namespace facade_generator {
namespace building {

using namespace placement;

FloorElements FloorGenerator::generate(const geom::Footprint& footprint, int floorIndex,
                                       uint32_t seed, const GenerationConfig& config,
                                       FloorGenerationStats* stats) const {
    config.validate();

    const uint32_t doorSeed = utils::SeedDeriver::derive(seed, "doors");
    const uint32_t windowSeed = utils::SeedDeriver::derive(seed, "windows");
    const uint32_t cornerSeed = utils::SeedDeriver::derive(seed, "corners");

    PolicyResult<Door> doors = DoorPolicy::place(footprint, floorIndex, doorSeed, config, *generators_.door);
    PolicyResult<Window> windows = WindowPolicy::place(footprint, floorIndex, windowSeed, config,
                                                       doors.occupancy, *generators_.window);
    std::vector<Corner> corners = CornerPolicy::place(footprint, floorIndex, cornerSeed, config,
                                                      *generators_.corner);

    if (stats) {
        stats->doorsRequested = floorIndex == 0
            ? DoorPolicy::targetCount(footprint.perimeter(), config.doorDensity) : 0;
        stats->windowsRequested = WindowPolicy::targetCount(footprint.perimeter(), config.windowDensity);
        stats->droppedDoors = doors.droppedCount;
        stats->droppedWindows = windows.droppedCount;
    }

    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Floor %d (seed %u): %zu doors, %zu windows, %zu corners",
                 floorIndex, seed, doors.elements.size(), windows.elements.size(), corners.size());

    FloorElements result;
    result.doors = std::move(doors.elements);
    result.windows = std::move(windows.elements);
    result.corners = std::move(corners);
    result.seed = seed;
    return result;
}

} // namespace building
} // namespace facade_generator
