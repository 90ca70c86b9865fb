#pragma once

#include <glm/glm.hpp>
#include <cmath>
#include <cstddef>

namespace facade_generator {
namespace geom {

// Lengths at or below this are treated as zero
constexpr double kLengthEpsilon = 1e-9;

/**
 * Edge - one side of a footprint, from vertex i to vertex (i + 1) % n.
 *
 * Derived data (length, direction, normal) is computed once on construction.
 * For a CCW footprint, the normal (dy, -dx) points away from the interior.
 */
struct Edge {
    glm::dvec2 start{0.0};
    glm::dvec2 end{0.0};
    double length = 0.0;
    glm::dvec2 direction{0.0};      // Unit vector start -> end, zero if degenerate
    glm::dvec2 outwardNormal{0.0};  // Unit vector, zero if degenerate

    Edge() = default;
    Edge(const glm::dvec2& a, const glm::dvec2& b) : start(a), end(b) {
        glm::dvec2 d = b - a;
        length = std::sqrt(d.x * d.x + d.y * d.y);
        if (isUsableLength(length)) {
            direction = d / length;
            outwardNormal = glm::dvec2(d.y / length, -d.x / length);
        }
    }

    bool isDegenerate() const { return !isUsableLength(length); }

    // Point at normalized parameter t (0 = start, 1 = end)
    glm::dvec2 pointAt(double t) const {
        return start + (end - start) * t;
    }

    // Normalized parameter for an offset in length units along the edge
    double normalizedOffset(double offset) const {
        if (isDegenerate()) return 0.0;
        return offset / length;
    }

    static bool isUsableLength(double len) {
        return std::isfinite(len) && len > kLengthEpsilon;
    }
};

} // namespace geom
} // namespace facade_generator
