#include "facade_generator/placement/Policies.hpp"
#include "facade_generator/placement/PlacementEngine.hpp"
#include "facade_generator/utils/SeedDeriver.hpp"
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cmath>
#include <utility>

namespace facade_generator {
namespace placement {

namespace {

size_t floorCount(double perimeter, double density) {
    double raw = perimeter * density;
    if (!std::isfinite(raw) || raw <= 0.0) return 0;
    if (raw >= static_cast<double>(kMaxTargetCount)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Policies: target of %g elements clamped to %zu", raw, kMaxTargetCount);
        return kMaxTargetCount;
    }
    return static_cast<size_t>(std::floor(raw));
}

} // namespace

size_t DoorPolicy::targetCount(double perimeter, double density) {
    return std::max<size_t>(1, floorCount(perimeter, density));
}

PolicyResult<Door> DoorPolicy::place(const geom::Footprint& footprint, int floorIndex,
                                     uint32_t branchSeed, const GenerationConfig& config,
                                     const DoorPropertyGenerator& properties) {
    PolicyResult<Door> result;
    result.occupancy = OccupancyMap(footprint.edgeCount());

    if (floorIndex != 0) {
        return result;
    }

    PlacementParams params;
    params.targetCount = targetCount(footprint.perimeter(), config.doorDensity);
    params.edgeSpacing = config.edgeSpacing;
    params.elementSpacing = config.doorSpacing;
    params.minUsableLength = config.doorMinUsableLength;
    params.maxAttempts = config.maxAttemptsPerElement;

    PlacementEngine engine(footprint);
    PlacementResult placed = engine.place(branchSeed, params, std::move(result.occupancy), "door");

    const size_t count = placed.placements.size();
    result.elements.reserve(count);
    for (size_t k = 0; k < count; ++k) {
        ElementContext context{floorIndex, k, count, config};
        uint32_t seed = utils::SeedDeriver::derive(branchSeed, "door", k);
        result.elements.push_back(
            Door::fromPlacement(placed.placements[k], floorIndex, properties.generate(seed, context)));
    }

    result.occupancy = std::move(placed.occupancy);
    result.droppedCount = placed.droppedCount;
    return result;
}

size_t WindowPolicy::targetCount(double perimeter, double density) {
    return floorCount(perimeter, density);
}

PolicyResult<Window> WindowPolicy::place(const geom::Footprint& footprint, int floorIndex,
                                         uint32_t branchSeed, const GenerationConfig& config,
                                         OccupancyMap doorOccupancy,
                                         const WindowPropertyGenerator& properties) {
    PlacementParams params;
    params.targetCount = targetCount(footprint.perimeter(), config.windowDensity);
    params.edgeSpacing = config.edgeSpacing;
    params.elementSpacing = config.windowSpacing;
    params.minUsableLength = config.windowMinUsableLength;
    params.maxAttempts = config.maxAttemptsPerElement;

    PlacementEngine engine(footprint);
    PlacementResult placed = engine.place(branchSeed, params, std::move(doorOccupancy), "window");

    PolicyResult<Window> result;
    const size_t count = placed.placements.size();
    result.elements.reserve(count);
    for (size_t k = 0; k < count; ++k) {
        ElementContext context{floorIndex, k, count, config};
        uint32_t seed = utils::SeedDeriver::derive(branchSeed, "window", k);
        result.elements.push_back(
            Window::fromPlacement(placed.placements[k], floorIndex, properties.generate(seed, context)));
    }

    result.occupancy = std::move(placed.occupancy);
    result.droppedCount = placed.droppedCount;
    return result;
}

std::vector<Corner> CornerPolicy::place(const geom::Footprint& footprint, int floorIndex,
                                        uint32_t branchSeed, const GenerationConfig& config,
                                        const CornerPropertyGenerator& properties) {
    const auto& verts = footprint.vertices();
    const size_t n = verts.size();

    std::vector<Corner> corners;
    corners.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        Corner corner;
        corner.vertexIndex = i;
        corner.position = verts[i];
        corner.prevPosition = verts[(i + n - 1) % n];
        corner.nextPosition = verts[(i + 1) % n];
        corner.floorIndex = floorIndex;

        ElementContext context{floorIndex, i, n, config};
        corner.properties = properties.generate(utils::SeedDeriver::derive(branchSeed, "corner", i), context);
        corners.push_back(corner);
    }
    return corners;
}

} // namespace placement
} // namespace facade_generator
