#pragma once

#include "facade_generator/GenerationConfig.hpp"
#include "facade_generator/building/FloorGenerator.hpp"
#include "facade_generator/geom/Footprint.hpp"
#include "facade_generator/placement/Elements.hpp"
#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace facade_generator {
namespace building {

/**
 * Floor - one level of a building: footprint, height and index, plus a
 * lazily generated element bundle.
 *
 * The first call to elements()/doors()/windows()/corners() generates the
 * bundle; later calls return the cached one unchanged, whatever seed or
 * config they pass. Call clearGenerated() to regenerate.
 */
class Floor {
public:
    explicit Floor(geom::Footprint footprint, double height = 3.0, int floorIndex = 0);

    static Floor fromVertices(const std::vector<glm::dvec2>& vertices, double height = 3.0,
                              int floorIndex = 0);

    const geom::Footprint& footprint() const { return footprint_; }
    double height() const { return height_; }
    int floorIndex() const { return floorIndex_; }

    const placement::FloorElements& elements(uint32_t seed, const GenerationConfig& config = {});
    const std::vector<placement::Door>& doors(uint32_t seed, const GenerationConfig& config = {});
    const std::vector<placement::Window>& windows(uint32_t seed, const GenerationConfig& config = {});
    const std::vector<placement::Corner>& corners(uint32_t seed, const GenerationConfig& config = {});

    bool isGenerated() const { return cache_.has_value(); }
    const std::optional<placement::FloorElements>& cached() const { return cache_; }
    const FloorGenerationStats& lastStats() const { return stats_; }

    void clearGenerated();

    // Replaces the property generators; drops the cache
    void setPropertyGenerators(const placement::ElementPropertyGenerators& generators);

    // cumulativeHeights[i] is the base elevation of floor i
    double zBase(const std::vector<double>& cumulativeHeights) const;
    double zTop(const std::vector<double>& cumulativeHeights) const;

private:
    geom::Footprint footprint_;
    double height_;
    int floorIndex_;
    FloorGenerator generator_;
    std::optional<placement::FloorElements> cache_;
    FloorGenerationStats stats_;
};

} // namespace building
} // namespace facade_generator
