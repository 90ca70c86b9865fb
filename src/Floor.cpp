#include "facade_generator/building/Floor.hpp"
#include <SDL3/SDL_log.h>
#include <utility>

namespace facade_generator {
namespace building {

Floor::Floor(geom::Footprint footprint, double height, int floorIndex)
    : footprint_(std::move(footprint)), height_(height), floorIndex_(floorIndex)
{
}

Floor Floor::fromVertices(const std::vector<glm::dvec2>& vertices, double height, int floorIndex) {
    return Floor(geom::Footprint(vertices), height, floorIndex);
}

const placement::FloorElements& Floor::elements(uint32_t seed, const GenerationConfig& config) {
    if (cache_) {
        if (cache_->seed != seed) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                        "Floor %d: elements cached for seed %u, ignoring seed %u (call clearGenerated() to regenerate)",
                        floorIndex_, cache_->seed, seed);
        }
        return *cache_;
    }

    stats_ = FloorGenerationStats{};
    cache_ = generator_.generate(footprint_, floorIndex_, seed, config, &stats_);
    return *cache_;
}

const std::vector<placement::Door>& Floor::doors(uint32_t seed, const GenerationConfig& config) {
    return elements(seed, config).doors;
}

const std::vector<placement::Window>& Floor::windows(uint32_t seed, const GenerationConfig& config) {
    return elements(seed, config).windows;
}

const std::vector<placement::Corner>& Floor::corners(uint32_t seed, const GenerationConfig& config) {
    return elements(seed, config).corners;
}

void Floor::clearGenerated() {
    cache_.reset();
    stats_ = FloorGenerationStats{};
}

void Floor::setPropertyGenerators(const placement::ElementPropertyGenerators& generators) {
    generator_ = FloorGenerator(generators);
    clearGenerated();
}

double Floor::zBase(const std::vector<double>& cumulativeHeights) const {
    if (floorIndex_ < 0 || static_cast<size_t>(floorIndex_) >= cumulativeHeights.size()) {
        return 0.0;
    }
    return cumulativeHeights[floorIndex_];
}

double Floor::zTop(const std::vector<double>& cumulativeHeights) const {
    return zBase(cumulativeHeights) + height_;
}

} // namespace building
} // namespace facade_generator
