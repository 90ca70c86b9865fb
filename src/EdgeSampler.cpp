#include "facade_generator/placement/EdgeSampler.hpp"
#include "facade_generator/geom/Edge.hpp"
#include <algorithm>
#include <iterator>

namespace facade_generator {
namespace placement {

EdgeSampler::EdgeSampler(const std::vector<double>& edgeLengths) {
    cumulative_.reserve(edgeLengths.size());
    double running = 0.0;
    for (double len : edgeLengths) {
        if (geom::Edge::isUsableLength(len)) {
            running += len;
        }
        cumulative_.push_back(running);
    }
    total_ = running;
}

std::optional<size_t> EdgeSampler::sample(utils::Random& rng) const {
    if (total_ <= 0.0) return std::nullopt;

    double r = rng.getFloat() * total_;

    // First edge whose cumulative length exceeds r. Zero-weight edges share
    // the previous cumulative value and are skipped by upper_bound.
    auto it = std::upper_bound(cumulative_.begin(), cumulative_.end(), r);
    if (it == cumulative_.end()) {
        // r rounded up to total_; take the last weighted edge
        it = std::lower_bound(cumulative_.begin(), cumulative_.end(), total_);
    }
    return static_cast<size_t>(std::distance(cumulative_.begin(), it));
}

} // namespace placement
} // namespace facade_generator
