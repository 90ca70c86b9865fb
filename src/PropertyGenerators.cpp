#include "facade_generator/placement/PropertyGenerators.hpp"
#include "facade_generator/Errors.hpp"
#include "facade_generator/utils/Random.hpp"
#include <cmath>
#include <string>

namespace facade_generator {
namespace placement {

namespace {

double readDimension(const nlohmann::json& params, const char* key, double fallback) {
    auto it = params.find(key);
    if (it == params.end()) return fallback;
    if (!it->is_number()) {
        throw InvalidConfiguration(std::string("style parameter '") + key + "' must be a number, got " +
                                   it->type_name());
    }
    double value = it->get<double>();
    if (!std::isfinite(value) || value < 0.0) {
        throw InvalidConfiguration(std::string("style parameter '") + key +
                                   "' must be finite and non-negative");
    }
    return value;
}

// A "<type>_styles" list wins over a single "<type>_style"
std::string readStyle(const nlohmann::json& params, const char* singleKey, const char* listKey,
                      uint32_t seed, const std::string& fallback) {
    auto list = params.find(listKey);
    if (list != params.end()) {
        if (!list->is_array()) {
            throw InvalidConfiguration(std::string("style parameter '") + listKey +
                                       "' must be an array of strings");
        }
        for (const auto& entry : *list) {
            if (!entry.is_string()) {
                throw InvalidConfiguration(std::string("style parameter '") + listKey +
                                           "' must contain only strings");
            }
        }
        if (!list->empty()) {
            utils::Random rng(seed);
            uint32_t pick = rng.getInt(static_cast<uint32_t>(list->size()));
            return (*list)[pick].get<std::string>();
        }
    }

    auto single = params.find(singleKey);
    if (single == params.end()) return fallback;
    if (!single->is_string()) {
        throw InvalidConfiguration(std::string("style parameter '") + singleKey + "' must be a string");
    }
    return single->get<std::string>();
}

const nlohmann::json& paramsOf(const ElementContext& context) {
    static const nlohmann::json empty = nlohmann::json::object();
    const nlohmann::json& params = context.config.styleParams;
    return params.is_object() ? params : empty;
}

} // namespace

DoorProperties DefaultDoorPropertyGenerator::generate(uint32_t seed, const ElementContext& context) const {
    const nlohmann::json& params = paramsOf(context);

    DoorProperties props;
    props.width = readDimension(params, "door_width", props.width);
    props.height = readDimension(params, "door_height", props.height);
    props.style = readStyle(params, "door_style", "door_styles", seed, props.style);
    props.isMainEntrance = context.index == 0;
    return props;
}

WindowProperties DefaultWindowPropertyGenerator::generate(uint32_t seed, const ElementContext& context) const {
    const nlohmann::json& params = paramsOf(context);

    WindowProperties props;
    props.width = readDimension(params, "window_width", props.width);
    props.height = readDimension(params, "window_height", props.height);
    props.sillHeight = readDimension(params, "sill_height", props.sillHeight);
    props.style = readStyle(params, "window_style", "window_styles", seed, props.style);
    return props;
}

CornerProperties DefaultCornerPropertyGenerator::generate(uint32_t seed, const ElementContext& context) const {
    const nlohmann::json& params = paramsOf(context);

    CornerProperties props;
    props.width = readDimension(params, "corner_size", context.config.cornerWidth);
    props.style = readStyle(params, "corner_style", "corner_styles", seed, props.style);
    return props;
}

ElementPropertyGenerators ElementPropertyGenerators::defaults() {
    ElementPropertyGenerators generators;
    generators.door = std::make_shared<DefaultDoorPropertyGenerator>();
    generators.window = std::make_shared<DefaultWindowPropertyGenerator>();
    generators.corner = std::make_shared<DefaultCornerPropertyGenerator>();
    return generators;
}

ElementPropertyGenerators ElementPropertyGenerators::resolved() const {
    ElementPropertyGenerators out = *this;
    if (!out.door) out.door = std::make_shared<DefaultDoorPropertyGenerator>();
    if (!out.window) out.window = std::make_shared<DefaultWindowPropertyGenerator>();
    if (!out.corner) out.corner = std::make_shared<DefaultCornerPropertyGenerator>();
    return out;
}

} // namespace placement
} // namespace facade_generator
