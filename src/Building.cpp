#include "facade_generator/building/Building.hpp"
#include "facade_generator/Errors.hpp"
#include "facade_generator/utils/SeedDeriver.hpp"
#include <SDL3/SDL_log.h>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace facade_generator {
namespace building {

namespace {

void checkHeight(size_t floorIndex, double height) {
    if (!std::isfinite(height) || height <= 0.0) {
        std::ostringstream msg;
        msg << "Building: floor " << floorIndex << " height must be positive and finite, got " << height;
        throw InvalidConfiguration(msg.str());
    }
}

} // namespace

Building::Building(const std::vector<std::vector<glm::dvec2>>& floorFootprints, uint32_t seed,
                   const std::vector<double>& floorHeights, double defaultFloorHeight)
    : seed_(seed)
{
    if (floorFootprints.empty()) {
        throw InvalidConfiguration("Building: at least one floor footprint is required");
    }
    if (!floorHeights.empty() && floorHeights.size() != floorFootprints.size()) {
        throw InvalidConfiguration("Building: floor_heights has " + std::to_string(floorHeights.size()) +
                                   " entries but there are " + std::to_string(floorFootprints.size()) +
                                   " floors");
    }

    floors_.reserve(floorFootprints.size());
    for (size_t i = 0; i < floorFootprints.size(); ++i) {
        double height = floorHeights.empty() ? defaultFloorHeight : floorHeights[i];
        checkHeight(i, height);
        floors_.push_back(Floor::fromVertices(floorFootprints[i], height, static_cast<int>(i)));
    }

    buildElevations();
}

Building::Building(std::vector<Floor> floors, uint32_t seed)
    : floors_(std::move(floors)), seed_(seed)
{
    if (floors_.empty()) {
        throw InvalidConfiguration("Building: at least one floor is required");
    }
    for (size_t i = 0; i < floors_.size(); ++i) {
        if (floors_[i].floorIndex() != static_cast<int>(i)) {
            throw InvalidConfiguration("Building: floor at position " + std::to_string(i) +
                                       " has floor index " + std::to_string(floors_[i].floorIndex()));
        }
        checkHeight(i, floors_[i].height());
    }

    buildElevations();
}

void Building::buildElevations() {
    cumulative_.assign(1, 0.0);
    cumulative_.reserve(floors_.size() + 1);
    for (const auto& f : floors_) {
        cumulative_.push_back(cumulative_.back() + f.height());
    }
}

Floor& Building::floor(size_t index) {
    if (index >= floors_.size()) {
        throw std::out_of_range("Building: floor " + std::to_string(index) + " out of range (" +
                                std::to_string(floors_.size()) + " floors)");
    }
    return floors_[index];
}

const Floor& Building::floor(size_t index) const {
    if (index >= floors_.size()) {
        throw std::out_of_range("Building: floor " + std::to_string(index) + " out of range (" +
                                std::to_string(floors_.size()) + " floors)");
    }
    return floors_[index];
}

double Building::floorZBase(size_t index) const {
    return floor(index).zBase(cumulative_);
}

double Building::floorZTop(size_t index) const {
    return floor(index).zTop(cumulative_);
}

uint32_t Building::floorSeed(size_t index) const {
    return utils::SeedDeriver::derive(seed_, "floor", index);
}

void Building::generateAll(const GenerationConfig& config) {
    size_t doors = 0, windows = 0;
    for (size_t i = 0; i < floors_.size(); ++i) {
        const auto& elements = floors_[i].elements(floorSeed(i), config);
        doors += elements.doors.size();
        windows += elements.windows.size();
    }
    SDL_Log("Building (seed %u): %zu floors, %zu doors, %zu windows", seed_, floors_.size(), doors, windows);
}

void Building::clearGenerated() {
    for (auto& f : floors_) {
        f.clearGenerated();
    }
}

double Building::zBaseForFloorIndex(int floorIndex) const {
    if (floorIndex < 0 || static_cast<size_t>(floorIndex) >= floors_.size()) {
        throw std::out_of_range("Building: element references floor " + std::to_string(floorIndex));
    }
    return cumulative_[floorIndex];
}

double Building::doorCenterZ(const placement::Door& door) const {
    return zBaseForFloorIndex(door.floorIndex) + door.properties.height / 2.0;
}

double Building::windowCenterZ(const placement::Window& window) const {
    return zBaseForFloorIndex(window.floorIndex) + window.properties.sillHeight +
           window.properties.height / 2.0;
}

glm::dvec3 Building::worldPosition(const glm::dvec2& planPosition, double z) const {
    return coords_.fromInternal(glm::dvec3(planPosition.x, planPosition.y, z));
}

} // namespace building
} // namespace facade_generator
