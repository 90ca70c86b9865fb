#include "facade_generator/placement/PlacementEngine.hpp"
#include "facade_generator/utils/Random.hpp"
#include <SDL3/SDL_log.h>
#include <cmath>
#include <initializer_list>
#include <stdexcept>

namespace facade_generator {
namespace placement {

PlacementEngine::PlacementEngine(const geom::Footprint& footprint)
    : footprint_(footprint), sampler_(footprint.edgeLengths())
{
}

std::optional<double> PlacementEngine::findClosestValidPosition(
    double target, double edgeLength, size_t edgeIndex,
    const OccupancyMap& occupancy, double edgeSpacing,
    double elementSpacing, double searchRadius, double step)
{
    if (!(step > 0.0) || !std::isfinite(searchRadius)) return std::nullopt;

    // Small bias so 1.5 / 0.1 gives 15 steps, not 14
    const int steps = static_cast<int>(std::floor(searchRadius / step + 1e-9));

    for (int k = 0; k <= steps; ++k) {
        for (int direction : {1, -1}) {
            if (k == 0 && direction == -1) continue;

            double candidate = target + direction * k * step;
            if (candidate < edgeSpacing || candidate > edgeLength - edgeSpacing) continue;

            if (occupancy.isFree(edgeIndex, candidate, elementSpacing)) {
                return candidate;
            }
        }
    }
    return std::nullopt;
}

PlacementResult PlacementEngine::place(uint32_t seed, const PlacementParams& params,
                                       OccupancyMap occupancy, const std::string& label) const {
    if (occupancy.edgeCount() != footprint_.edgeCount()) {
        throw std::invalid_argument("PlacementEngine: occupancy map has " +
                                    std::to_string(occupancy.edgeCount()) + " edges, footprint has " +
                                    std::to_string(footprint_.edgeCount()));
    }

    PlacementResult result;
    result.placements.reserve(params.targetCount);

    utils::Random rng(seed);

    for (size_t elementIdx = 0; elementIdx < params.targetCount; ++elementIdx) {
        bool placed = false;

        for (int attempt = 0; attempt < params.maxAttempts && !placed; ++attempt) {
            std::optional<size_t> sampled = sampler_.sample(rng);
            if (!sampled) break;  // Nothing selectable at all

            const size_t edgeIdx = *sampled;
            const geom::Edge& edge = footprint_.edge(edgeIdx);

            if (!isEdgeUsable(edge.length, params.edgeSpacing, params.minUsableLength)) {
                continue;
            }

            double offset = rng.uniform(params.edgeSpacing, edge.length - params.edgeSpacing);

            if (!occupancy.isFree(edgeIdx, offset, params.elementSpacing)) {
                std::optional<double> nearest = findClosestValidPosition(
                    offset, edge.length, edgeIdx, occupancy, params.edgeSpacing,
                    params.elementSpacing, params.elementSpacing, params.searchStep);
                if (!nearest) continue;
                offset = *nearest;
            }

            double t = edge.normalizedOffset(offset);
            if (!std::isfinite(t)) continue;

            occupancy.reserve(edgeIdx, offset, params.elementSpacing);

            EdgePlacement placement;
            placement.edgeIndex = edgeIdx;
            placement.offset = offset;
            placement.positionOnEdge = t;
            placement.worldPosition = edge.pointAt(t);
            placement.facing = edge.outwardNormal;
            result.placements.push_back(placement);
            placed = true;
        }

        if (!placed) {
            result.droppedCount++;
            SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Could not place %s %zu after %d attempts, skipping",
                         label.c_str(), elementIdx + 1, params.maxAttempts);
        }
    }

    if (result.droppedCount > 0) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Placed %zu of %zu %ss (%zu dropped under spacing constraints)",
                    result.placements.size(), params.targetCount, label.c_str(), result.droppedCount);
    }

    result.occupancy = std::move(occupancy);
    return result;
}

} // namespace placement
} // namespace facade_generator
