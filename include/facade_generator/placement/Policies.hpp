#pragma once

#include "facade_generator/GenerationConfig.hpp"
#include "facade_generator/geom/Footprint.hpp"
#include "facade_generator/placement/Elements.hpp"
#include "facade_generator/placement/OccupancyMap.hpp"
#include "facade_generator/placement/PropertyGenerators.hpp"
#include <cstdint>
#include <vector>

namespace facade_generator {
namespace placement {

// Upper bound on the elements one policy run will try to place
constexpr size_t kMaxTargetCount = 100000;

template <typename Element>
struct PolicyResult {
    std::vector<Element> elements;
    OccupancyMap occupancy;     // Reservations so far, for the next policy
    size_t droppedCount = 0;
};

/**
 * DoorPolicy - doors are ground floor only.
 *
 * Target count is max(1, floor(perimeter * doorDensity)). Placement runs
 * against a fresh occupancy map with doorSpacing between door centres.
 * Upper floors get no doors and an empty map sized to the edge count.
 */
class DoorPolicy {
public:
    static size_t targetCount(double perimeter, double density);

    static PolicyResult<Door> place(const geom::Footprint& footprint, int floorIndex,
                                    uint32_t branchSeed, const GenerationConfig& config,
                                    const DoorPropertyGenerator& properties);
};

/**
 * WindowPolicy - windows on every floor, placed after doors.
 *
 * Target count is floor(perimeter * windowDensity), possibly zero. Starts
 * from a copy of the door map so windows keep clear of existing doors.
 */
class WindowPolicy {
public:
    static size_t targetCount(double perimeter, double density);

    static PolicyResult<Window> place(const geom::Footprint& footprint, int floorIndex,
                                      uint32_t branchSeed, const GenerationConfig& config,
                                      OccupancyMap doorOccupancy,
                                      const WindowPropertyGenerator& properties);
};

// One corner per footprint vertex, in vertex order
class CornerPolicy {
public:
    static std::vector<Corner> place(const geom::Footprint& footprint, int floorIndex,
                                     uint32_t branchSeed, const GenerationConfig& config,
                                     const CornerPropertyGenerator& properties);
};

} // namespace placement
} // namespace facade_generator
