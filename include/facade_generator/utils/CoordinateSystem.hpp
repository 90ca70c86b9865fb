#pragma once

#include <glm/glm.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace facade_generator {
namespace utils {

enum class UpAxis {
    Z,  // Internal convention: X right, Y forward, Z up
    Y   // X right, Y up, Z forward
};

/**
 * CoordinateSystem - converts between the internal Z-up frame and the frame
 * a consumer expects. A value type; pass it to whoever exports positions.
 */
class CoordinateSystem {
public:
    explicit CoordinateSystem(UpAxis up = UpAxis::Z) : up_(up) {}

    UpAxis upAxis() const { return up_; }

    // From this system into internal Z-up
    glm::dvec3 toInternal(const glm::dvec3& p) const {
        if (up_ == UpAxis::Z) return p;
        // Y-up to Z-up: (x, y, z) -> (x, -z, y)
        return glm::dvec3(p.x, -p.z, p.y);
    }

    // From internal Z-up into this system
    glm::dvec3 fromInternal(const glm::dvec3& p) const {
        if (up_ == UpAxis::Z) return p;
        // Z-up to Y-up: (x, y, z) -> (x, z, -y)
        return glm::dvec3(p.x, p.z, -p.y);
    }

    std::vector<glm::dvec3> convertPoints(const std::vector<glm::dvec3>& points, bool fromZUp = true) const {
        std::vector<glm::dvec3> out;
        out.reserve(points.size());
        for (const auto& p : points) {
            out.push_back(fromZUp ? fromInternal(p) : toInternal(p));
        }
        return out;
    }

    static std::optional<UpAxis> parseAxis(std::string_view name) {
        if (name == "z" || name == "Z") return UpAxis::Z;
        if (name == "y" || name == "Y") return UpAxis::Y;
        return std::nullopt;
    }

private:
    UpAxis up_;
};

} // namespace utils
} // namespace facade_generator
