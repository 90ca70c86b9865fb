#pragma once

#include <cstddef>
#include <vector>

namespace facade_generator {
namespace placement {

// Reserved span along one edge, in length units from the edge start
struct OccupiedInterval {
    double start = 0.0;
    double end = 0.0;

    bool operator==(const OccupiedInterval& other) const {
        return start == other.start && end == other.end;
    }
};

/**
 * OccupancyMap - per-edge list of reserved intervals for one generation run.
 *
 * A candidate centre c with spacing s occupies [c - s/2, c + s/2]. It
 * collides with a reserved interval unless it lies strictly before or
 * strictly after it.
 *
 * Value type: a later policy starts from a copy of an earlier policy's map,
 * so reservations only flow forward (doors -> windows).
 */
class OccupancyMap {
public:
    OccupancyMap() = default;
    explicit OccupancyMap(size_t edgeCount) : intervals_(edgeCount) {}

    size_t edgeCount() const { return intervals_.size(); }

    // Throws std::out_of_range for an unknown edge
    bool isFree(size_t edgeIndex, double centre, double spacing) const;

    void reserve(size_t edgeIndex, double centre, double spacing);

    const std::vector<OccupiedInterval>& intervals(size_t edgeIndex) const;

    size_t totalReserved() const;

    bool operator==(const OccupancyMap& other) const { return intervals_ == other.intervals_; }

private:
    std::vector<std::vector<OccupiedInterval>> intervals_;
};

} // namespace placement
} // namespace facade_generator
