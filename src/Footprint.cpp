#include "facade_generator/geom/Footprint.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace facade_generator {
namespace geom {

namespace {

constexpr double kAreaEpsilon = 1e-9;

double cross(const glm::dvec2& a, const glm::dvec2& b, const glm::dvec2& c) {
    return (b.x - a.x) * (c.y - a.y) - (b.y - a.y) * (c.x - a.x);
}

int orientation(const glm::dvec2& a, const glm::dvec2& b, const glm::dvec2& c) {
    double v = cross(a, b, c);
    if (v > kAreaEpsilon) return 1;
    if (v < -kAreaEpsilon) return -1;
    return 0;
}

bool onSegment(const glm::dvec2& a, const glm::dvec2& b, const glm::dvec2& p) {
    return p.x >= std::min(a.x, b.x) - kLengthEpsilon && p.x <= std::max(a.x, b.x) + kLengthEpsilon &&
           p.y >= std::min(a.y, b.y) - kLengthEpsilon && p.y <= std::max(a.y, b.y) + kLengthEpsilon;
}

bool segmentsIntersect(const glm::dvec2& p1, const glm::dvec2& p2,
                       const glm::dvec2& q1, const glm::dvec2& q2) {
    int o1 = orientation(p1, p2, q1);
    int o2 = orientation(p1, p2, q2);
    int o3 = orientation(q1, q2, p1);
    int o4 = orientation(q1, q2, p2);

    if (o1 != o2 && o3 != o4) return true;

    // Collinear cases
    if (o1 == 0 && onSegment(p1, p2, q1)) return true;
    if (o2 == 0 && onSegment(p1, p2, q2)) return true;
    if (o3 == 0 && onSegment(q1, q2, p1)) return true;
    if (o4 == 0 && onSegment(q1, q2, p2)) return true;
    return false;
}

// True when every edge from index `from` up to (not including) `to`,
// walking forward around the ring, has zero length.
bool degenerateRun(const std::vector<glm::dvec2>& vertices, size_t from, size_t to) {
    const size_t n = vertices.size();
    for (size_t k = from; k != to; k = (k + 1) % n) {
        if (glm::distance(vertices[k], vertices[(k + 1) % n]) > kLengthEpsilon) {
            return false;
        }
    }
    return true;
}

// Non-adjacent edges i < j that are only separated by zero-length edges
// meet at a repeated vertex, which is not a crossing.
bool joinedThroughDegenerateEdges(const std::vector<glm::dvec2>& vertices, size_t i, size_t j) {
    const size_t n = vertices.size();
    return degenerateRun(vertices, i + 1, j) || degenerateRun(vertices, (j + 1) % n, i);
}

} // namespace

Footprint::Footprint(const std::vector<glm::dvec2>& input) {
    std::vector<glm::dvec2> verts = input;

    if (verts.size() > 3 && verts.front() == verts.back()) {
        verts.pop_back();
    }

    if (verts.size() < 3) {
        throw InvalidGeometry("Footprint needs at least 3 vertices, got " +
                              std::to_string(verts.size()));
    }

    for (size_t i = 0; i < verts.size(); ++i) {
        if (!std::isfinite(verts[i].x) || !std::isfinite(verts[i].y)) {
            throw InvalidGeometry("Footprint vertex " + std::to_string(i) +
                                  " has a non-finite coordinate");
        }
    }

    double ringArea = signedArea(verts);
    if (std::abs(ringArea) <= kAreaEpsilon) {
        throw InvalidGeometry("Footprint has zero area");
    }

    if (!isSimple(verts)) {
        throw InvalidGeometry("Footprint is self-intersecting");
    }

    // Canonical winding is CCW; keep vertex 0 in place when reversing
    if (ringArea < 0.0) {
        std::reverse(verts.begin() + 1, verts.end());
        reversed_ = true;
    }

    vertices_ = std::move(verts);
    area_ = std::abs(ringArea);

    const size_t n = vertices_.size();
    edges_.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        edges_.emplace_back(vertices_[i], vertices_[(i + 1) % n]);
        perimeter_ += edges_.back().length;
    }
}

std::vector<double> Footprint::edgeLengths() const {
    std::vector<double> lengths;
    lengths.reserve(edges_.size());
    for (const Edge& e : edges_) {
        lengths.push_back(e.length);
    }
    return lengths;
}

bool Footprint::contains(const glm::dvec2& point) const {
    bool inside = false;
    const size_t n = vertices_.size();
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const glm::dvec2& a = vertices_[i];
        const glm::dvec2& b = vertices_[j];
        if ((a.y > point.y) != (b.y > point.y)) {
            double xCross = (b.x - a.x) * (point.y - a.y) / (b.y - a.y) + a.x;
            if (point.x < xCross) {
                inside = !inside;
            }
        }
    }
    return inside;
}

double Footprint::signedArea(const std::vector<glm::dvec2>& vertices) {
    if (vertices.size() < 3) return 0.0;

    double s = 0.0;
    const size_t n = vertices.size();
    for (size_t i = 0; i < n; ++i) {
        const glm::dvec2& v1 = vertices[i];
        const glm::dvec2& v2 = vertices[(i + 1) % n];
        s += v1.x * v2.y - v2.x * v1.y;
    }
    return s * 0.5;
}

bool Footprint::isSimple(const std::vector<glm::dvec2>& vertices) {
    const size_t n = vertices.size();
    if (n < 3) return false;

    for (size_t i = 0; i < n; ++i) {
        const glm::dvec2& a1 = vertices[i];
        const glm::dvec2& a2 = vertices[(i + 1) % n];

        for (size_t j = i + 1; j < n; ++j) {
            // Adjacent edges always share a vertex
            if (j == i + 1 || (i == 0 && j == n - 1)) continue;

            const glm::dvec2& b1 = vertices[j];
            const glm::dvec2& b2 = vertices[(j + 1) % n];

            if (segmentsIntersect(a1, a2, b1, b2) && !joinedThroughDegenerateEdges(vertices, i, j)) {
                return false;
            }
        }
    }
    return true;
}

} // namespace geom
} // namespace facade_generator
