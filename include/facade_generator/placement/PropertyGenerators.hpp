#pragma once

#include "facade_generator/GenerationConfig.hpp"
#include "facade_generator/placement/Elements.hpp"
#include <cstdint>
#include <memory>

namespace facade_generator {
namespace placement {

// What a property generator knows about the element it is decorating
struct ElementContext {
    int floorIndex = 0;
    size_t index = 0;          // Placement order within its type
    size_t totalCount = 0;     // Number of elements of this type actually placed
    const GenerationConfig& config;
};

/**
 * Interface for door property generation.
 * Receives a seed already derived for this door; implementations must be
 * pure functions of (seed, context).
 */
class DoorPropertyGenerator {
public:
    virtual ~DoorPropertyGenerator() = default;
    virtual DoorProperties generate(uint32_t seed, const ElementContext& context) const = 0;
};

/**
 * Interface for window property generation.
 */
class WindowPropertyGenerator {
public:
    virtual ~WindowPropertyGenerator() = default;
    virtual WindowProperties generate(uint32_t seed, const ElementContext& context) const = 0;
};

/**
 * Interface for corner property generation.
 */
class CornerPropertyGenerator {
public:
    virtual ~CornerPropertyGenerator() = default;
    virtual CornerProperties generate(uint32_t seed, const ElementContext& context) const = 0;
};

/**
 * Default door properties: 1.0 x 2.1, "standard" style.
 * styleParams overrides: door_width, door_height, door_style, door_styles
 * (array, one picked per door from the seed). The first placed door is the
 * main entrance.
 */
class DefaultDoorPropertyGenerator : public DoorPropertyGenerator {
public:
    DoorProperties generate(uint32_t seed, const ElementContext& context) const override;
};

/**
 * Default window properties: 1.2 x 1.5 with a 0.9 sill.
 * styleParams overrides: window_width, window_height, sill_height,
 * window_style, window_styles.
 */
class DefaultWindowPropertyGenerator : public WindowPropertyGenerator {
public:
    WindowProperties generate(uint32_t seed, const ElementContext& context) const override;
};

/**
 * Default corner properties: width from GenerationConfig::cornerWidth
 * unless styleParams has corner_size. corner_style / corner_styles as above.
 */
class DefaultCornerPropertyGenerator : public CornerPropertyGenerator {
public:
    CornerProperties generate(uint32_t seed, const ElementContext& context) const override;
};

// Generator set used by the floor orchestrator. Null members fall back to the defaults.
struct ElementPropertyGenerators {
    std::shared_ptr<const DoorPropertyGenerator> door;
    std::shared_ptr<const WindowPropertyGenerator> window;
    std::shared_ptr<const CornerPropertyGenerator> corner;

    static ElementPropertyGenerators defaults();

    // Copy with any null member replaced by its default
    ElementPropertyGenerators resolved() const;
};

} // namespace placement
} // namespace facade_generator
