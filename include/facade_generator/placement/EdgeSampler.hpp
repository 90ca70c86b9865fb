#pragma once

#include "facade_generator/utils/Random.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace facade_generator {
namespace placement {

/**
 * EdgeSampler - picks an edge index with probability proportional to length.
 *
 * Degenerate edges (near-zero or non-finite length) get zero weight and can
 * never be returned.
 */
class EdgeSampler {
public:
    explicit EdgeSampler(const std::vector<double>& edgeLengths);

    // Empty when every edge is degenerate
    std::optional<size_t> sample(utils::Random& rng) const;

    double totalWeight() const { return total_; }
    size_t edgeCount() const { return cumulative_.size(); }
    bool hasSelectableEdge() const { return total_ > 0.0; }

private:
    std::vector<double> cumulative_;
    double total_ = 0.0;
};

} // namespace placement
} // namespace facade_generator
