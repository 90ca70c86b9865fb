#pragma once

#include "facade_generator/geom/Edge.hpp"
#include <glm/glm.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace facade_generator {
namespace geom {

/**
 * Thrown when a vertex list cannot form a valid footprint.
 */
class InvalidGeometry : public std::runtime_error {
public:
    explicit InvalidGeometry(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Footprint - validated 2D outline of a building floor.
 *
 * Construction either yields a closed, simple polygon with CCW winding or
 * throws InvalidGeometry. The polygon is never repaired: self-intersecting,
 * zero-area or non-finite input is rejected as-is. A trailing vertex equal
 * to the first one (explicitly closed ring) is dropped.
 *
 * Immutable after construction; edges and lengths are precomputed.
 */
class Footprint {
public:
    explicit Footprint(const std::vector<glm::dvec2>& vertices);

    const std::vector<glm::dvec2>& vertices() const { return vertices_; }
    const std::vector<Edge>& edges() const { return edges_; }
    const Edge& edge(size_t index) const { return edges_.at(index); }

    size_t vertexCount() const { return vertices_.size(); }
    size_t edgeCount() const { return edges_.size(); }

    // Lengths in edge order (same indexing as edges())
    std::vector<double> edgeLengths() const;

    double perimeter() const { return perimeter_; }
    double area() const { return area_; }

    // Even-odd point-in-polygon test; points on the boundary count as outside
    bool contains(const glm::dvec2& point) const;

    // True if the vertices passed to the constructor were clockwise
    bool wasReversed() const { return reversed_; }

    // Signed shoelace area: positive for CCW, negative for CW
    static double signedArea(const std::vector<glm::dvec2>& vertices);

    // True when no two non-adjacent edges touch or cross
    static bool isSimple(const std::vector<glm::dvec2>& vertices);

private:
    std::vector<glm::dvec2> vertices_;
    std::vector<Edge> edges_;
    double perimeter_ = 0.0;
    double area_ = 0.0;
    bool reversed_ = false;
};

} // namespace geom
} // namespace facade_generator
