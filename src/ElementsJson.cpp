#include "facade_generator/building/ElementsJson.hpp"
#include <SDL3/SDL_log.h>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace facade_generator {
namespace building {

namespace {

json vec2(const glm::dvec2& v) {
    return json::array({v.x, v.y});
}

json vec3(const glm::dvec3& v) {
    return json::array({v.x, v.y, v.z});
}

template <typename Element>
json edgeElementJson(const Element& e) {
    json j;
    j["edge_index"] = e.edgeIndex;
    j["position_on_edge"] = e.positionOnEdge;
    j["offset"] = e.offset;
    j["position"] = vec2(e.worldPosition);
    j["facing"] = vec2(e.facing);
    j["floor_index"] = e.floorIndex;
    return j;
}

} // namespace

json toJson(const placement::Door& door) {
    json j = edgeElementJson(door);
    j["width"] = door.properties.width;
    j["height"] = door.properties.height;
    j["is_main_entrance"] = door.properties.isMainEntrance;
    j["style"] = door.properties.style;
    return j;
}

json toJson(const placement::Window& window) {
    json j = edgeElementJson(window);
    j["width"] = window.properties.width;
    j["height"] = window.properties.height;
    j["sill_height"] = window.properties.sillHeight;
    j["style"] = window.properties.style;
    return j;
}

json toJson(const placement::Corner& corner) {
    json j;
    j["vertex_index"] = corner.vertexIndex;
    j["position"] = vec2(corner.position);
    j["prev_position"] = vec2(corner.prevPosition);
    j["next_position"] = vec2(corner.nextPosition);
    j["floor_index"] = corner.floorIndex;
    j["width"] = corner.properties.width;
    j["style"] = corner.properties.style;
    return j;
}

json toJson(const placement::FloorElements& elements) {
    json j;
    j["seed"] = elements.seed;

    json doors = json::array();
    for (const auto& d : elements.doors) doors.push_back(toJson(d));
    j["doors"] = doors;

    json windows = json::array();
    for (const auto& w : elements.windows) windows.push_back(toJson(w));
    j["windows"] = windows;

    json corners = json::array();
    for (const auto& c : elements.corners) corners.push_back(toJson(c));
    j["corners"] = corners;

    return j;
}

json toJson(const Building& building) {
    json j;
    j["seed"] = building.seed();
    j["up_axis"] = building.coordinateSystem().upAxis() == utils::UpAxis::Z ? "z" : "y";
    j["total_height"] = building.totalHeight();

    json floors = json::array();
    for (size_t i = 0; i < building.numFloors(); ++i) {
        const Floor& f = building.floor(i);

        json fj;
        fj["index"] = f.floorIndex();
        fj["height"] = f.height();
        fj["z_base"] = building.floorZBase(i);
        fj["z_top"] = building.floorZTop(i);

        json outline = json::array();
        for (const auto& v : f.footprint().vertices()) outline.push_back(vec2(v));
        fj["footprint"] = outline;

        if (const auto& cached = f.cached()) {
            json ej = toJson(*cached);
            for (size_t k = 0; k < cached->doors.size(); ++k) {
                const auto& d = cached->doors[k];
                ej["doors"][k]["world"] = vec3(building.worldPosition(d.worldPosition, building.doorCenterZ(d)));
            }
            for (size_t k = 0; k < cached->windows.size(); ++k) {
                const auto& w = cached->windows[k];
                ej["windows"][k]["world"] = vec3(building.worldPosition(w.worldPosition, building.windowCenterZ(w)));
            }
            fj["elements"] = ej;
        }

        floors.push_back(fj);
    }
    j["floors"] = floors;

    return j;
}

void saveBuilding(const Building& building, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open output file: " + path);
    }
    file << toJson(building).dump(2);
    if (!file) {
        throw std::runtime_error("Failed to write output file: " + path);
    }
    SDL_Log("Saved %zu floors to %s", building.numFloors(), path.c_str());
}

} // namespace building
} // namespace facade_generator
