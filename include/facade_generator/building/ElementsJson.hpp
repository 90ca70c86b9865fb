#pragma once

#include "facade_generator/building/Building.hpp"
#include "facade_generator/placement/Elements.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace facade_generator {
namespace building {

nlohmann::json toJson(const placement::Door& door);
nlohmann::json toJson(const placement::Window& window);
nlohmann::json toJson(const placement::Corner& corner);

// {"seed", "doors": [...], "windows": [...], "corners": [...]}
nlohmann::json toJson(const placement::FloorElements& elements);

/**
 * Whole-building export. Each floor entry carries its elevation and the
 * cached bundle (floors not generated yet are exported without elements).
 * Element centres are also given in 3D, in the building's coordinate
 * system, under "world".
 */
nlohmann::json toJson(const Building& building);

// Writes toJson(building) with 2-space indentation, throws std::runtime_error on I/O failure
void saveBuilding(const Building& building, const std::string& path);

} // namespace building
} // namespace facade_generator
