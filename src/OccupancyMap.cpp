#include "facade_generator/placement/OccupancyMap.hpp"
#include <stdexcept>
#include <string>

namespace facade_generator {
namespace placement {

bool OccupancyMap::isFree(size_t edgeIndex, double centre, double spacing) const {
    const double half = spacing / 2.0;
    for (const OccupiedInterval& occupied : intervals(edgeIndex)) {
        if (!(centre + half < occupied.start || centre - half > occupied.end)) {
            return false;
        }
    }
    return true;
}

void OccupancyMap::reserve(size_t edgeIndex, double centre, double spacing) {
    if (edgeIndex >= intervals_.size()) {
        throw std::out_of_range("OccupancyMap: edge " + std::to_string(edgeIndex) +
                                " out of range (" + std::to_string(intervals_.size()) + " edges)");
    }
    const double half = spacing / 2.0;
    intervals_[edgeIndex].push_back(OccupiedInterval{centre - half, centre + half});
}

const std::vector<OccupiedInterval>& OccupancyMap::intervals(size_t edgeIndex) const {
    if (edgeIndex >= intervals_.size()) {
        throw std::out_of_range("OccupancyMap: edge " + std::to_string(edgeIndex) +
                                " out of range (" + std::to_string(intervals_.size()) + " edges)");
    }
    return intervals_[edgeIndex];
}

size_t OccupancyMap::totalReserved() const {
    size_t count = 0;
    for (const auto& edgeIntervals : intervals_) {
        count += edgeIntervals.size();
    }
    return count;
}

} // namespace placement
} // namespace facade_generator
