#pragma once

#include "facade_generator/GenerationConfig.hpp"
#include "facade_generator/building/Floor.hpp"
#include "facade_generator/placement/Elements.hpp"
#include "facade_generator/utils/CoordinateSystem.hpp"
#include <glm/glm.hpp>
#include <cstdint>
#include <vector>

namespace facade_generator {
namespace building {

/**
 * Building - a stack of floors (bottom to top) sharing one seed.
 *
 * Each floor may have its own footprint and height. Floor i generates its
 * elements from floorSeed(i) = derive(seed, "floor", i), so floors are
 * independent of each other and of the floor count.
 *
 * Elevations are cumulative: floor i sits on top of floors 0..i-1.
 */
class Building {
public:
    // floorHeights empty: every floor uses defaultFloorHeight
    Building(const std::vector<std::vector<glm::dvec2>>& floorFootprints, uint32_t seed,
             const std::vector<double>& floorHeights = {}, double defaultFloorHeight = 3.0);

    // Floors must be given in order, floor i with floorIndex() == i
    Building(std::vector<Floor> floors, uint32_t seed);

    size_t numFloors() const { return floors_.size(); }
    uint32_t seed() const { return seed_; }

    // Range-checked, throws std::out_of_range
    Floor& floor(size_t index);
    const Floor& floor(size_t index) const;

    std::vector<Floor>& floors() { return floors_; }
    const std::vector<Floor>& floors() const { return floors_; }

    // numFloors() + 1 entries: base of each floor, then the roof
    const std::vector<double>& cumulativeHeights() const { return cumulative_; }

    double floorZBase(size_t index) const;
    double floorZTop(size_t index) const;
    double totalHeight() const { return cumulative_.back(); }

    uint32_t floorSeed(size_t index) const;

    // Fills every floor cache with its own seed (no-op for cached floors)
    void generateAll(const GenerationConfig& config = {});
    void clearGenerated();

    double doorCenterZ(const placement::Door& door) const;
    double windowCenterZ(const placement::Window& window) const;

    // Plan position plus elevation, in the output coordinate system
    glm::dvec3 worldPosition(const glm::dvec2& planPosition, double z) const;

    const utils::CoordinateSystem& coordinateSystem() const { return coords_; }
    void setCoordinateSystem(const utils::CoordinateSystem& coords) { coords_ = coords; }

private:
    void buildElevations();
    double zBaseForFloorIndex(int floorIndex) const;

    std::vector<Floor> floors_;
    uint32_t seed_;
    std::vector<double> cumulative_;
    utils::CoordinateSystem coords_;
};

} // namespace building
} // namespace facade_generator
