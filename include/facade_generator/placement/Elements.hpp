#pragma once

#include "facade_generator/placement/PlacementEngine.hpp"
#include <glm/glm.hpp>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace facade_generator {
namespace placement {

struct DoorProperties {
    double width = 1.0;
    double height = 2.1;
    bool isMainEntrance = false;
    std::string style = "standard";

    bool operator==(const DoorProperties&) const = default;
};

struct WindowProperties {
    double width = 1.2;
    double height = 1.5;
    double sillHeight = 0.9;     // Above the floor base
    std::string style = "standard";

    bool operator==(const WindowProperties&) const = default;
};

struct CornerProperties {
    double width = 0.15;
    std::string style = "standard";

    bool operator==(const CornerProperties&) const = default;
};

/**
 * EdgeElement - an element sitting on a footprint edge (door or window):
 * the placement computed by the engine plus the property bundle.
 */
template <typename Properties>
struct EdgeElement {
    size_t edgeIndex = 0;
    double positionOnEdge = 0.0;    // Normalized [0, 1]
    double offset = 0.0;            // Length units from the edge start
    glm::dvec2 worldPosition{0.0};
    glm::dvec2 facing{0.0};         // Outward unit normal
    int floorIndex = 0;
    Properties properties;

    static EdgeElement fromPlacement(const EdgePlacement& p, int floorIdx, Properties props) {
        EdgeElement e;
        e.edgeIndex = p.edgeIndex;
        e.positionOnEdge = p.positionOnEdge;
        e.offset = p.offset;
        e.worldPosition = p.worldPosition;
        e.facing = p.facing;
        e.floorIndex = floorIdx;
        e.properties = std::move(props);
        return e;
    }

    bool operator==(const EdgeElement&) const = default;
};

using Door = EdgeElement<DoorProperties>;
using Window = EdgeElement<WindowProperties>;

struct Corner {
    size_t vertexIndex = 0;
    glm::dvec2 position{0.0};
    glm::dvec2 prevPosition{0.0};
    glm::dvec2 nextPosition{0.0};
    int floorIndex = 0;
    CornerProperties properties;

    bool operator==(const Corner&) const = default;
};

// Everything generated for one floor
struct FloorElements {
    std::vector<Door> doors;
    std::vector<Window> windows;
    std::vector<Corner> corners;
    uint32_t seed = 0;

    bool operator==(const FloorElements&) const = default;
};

} // namespace placement
} // namespace facade_generator
