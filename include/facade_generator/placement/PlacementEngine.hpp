#pragma once

#include "facade_generator/geom/Footprint.hpp"
#include "facade_generator/placement/EdgeSampler.hpp"
#include "facade_generator/placement/OccupancyMap.hpp"
#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace facade_generator {
namespace placement {

struct PlacementParams {
    size_t targetCount = 0;
    double edgeSpacing = 1.0;       // Min distance of a centre from either edge end
    double elementSpacing = 1.0;    // Min distance between element centres
    double minUsableLength = 0.5;   // Edge must be >= 2 * edgeSpacing + this
    int maxAttempts = 10;           // Per element
    double searchStep = 0.1;        // Local search resolution
};

// One successful placement along a footprint edge
struct EdgePlacement {
    size_t edgeIndex = 0;
    double offset = 0.0;            // Length units from the edge start
    double positionOnEdge = 0.0;    // Normalized [0, 1]
    glm::dvec2 worldPosition{0.0};
    glm::dvec2 facing{0.0};         // Outward unit normal of the edge

    bool operator==(const EdgePlacement& other) const {
        return edgeIndex == other.edgeIndex && offset == other.offset &&
               positionOnEdge == other.positionOnEdge &&
               worldPosition == other.worldPosition && facing == other.facing;
    }
};

struct PlacementResult {
    std::vector<EdgePlacement> placements;  // Generation order
    OccupancyMap occupancy;                 // Input map plus new reservations
    size_t droppedCount = 0;
};

/**
 * PlacementEngine - places N elements along a footprint's edges.
 *
 * Per element, up to maxAttempts times:
 *   1. sample an edge weighted by length; edges shorter than
 *      2 * edgeSpacing + minUsableLength reject the attempt
 *   2. draw a centre uniformly in [edgeSpacing, length - edgeSpacing]
 *   3. if it collides with the occupancy map, search outward in searchStep
 *      increments up to elementSpacing for the nearest free centre
 *   4. no free centre on this edge: next attempt
 *   5. success: reserve the interval and record the placement
 * An element that runs out of attempts is dropped and counted.
 *
 * Stateless apart from the footprint reference; every call builds its own
 * Random from the seed, so calls with equal arguments return equal results.
 */
class PlacementEngine {
public:
    explicit PlacementEngine(const geom::Footprint& footprint);

    PlacementResult place(uint32_t seed, const PlacementParams& params,
                          OccupancyMap occupancy, const std::string& label = "element") const;

    /**
     * Nearest collision-free centre to target on one edge, scanning
     * target + k*step then target - k*step for k = 0..floor(radius/step).
     * Candidates outside [edgeSpacing, edgeLength - edgeSpacing] are skipped.
     */
    static std::optional<double> findClosestValidPosition(
        double target, double edgeLength, size_t edgeIndex,
        const OccupancyMap& occupancy, double edgeSpacing,
        double elementSpacing, double searchRadius, double step);

    static bool isEdgeUsable(double edgeLength, double edgeSpacing, double minUsableLength) {
        return edgeLength >= 2.0 * edgeSpacing + minUsableLength;
    }

private:
    const geom::Footprint& footprint_;
    EdgeSampler sampler_;
};

} // namespace placement
} // namespace facade_generator
