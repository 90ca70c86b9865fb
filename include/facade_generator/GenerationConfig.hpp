#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace facade_generator {

/**
 * Parameters for generating the elements of a floor.
 *
 * Recognized JSON keys map to typed fields below. Every other key is kept
 * verbatim in styleParams and only read by the property generators
 * (door/window/corner sizes and styles).
 */
struct GenerationConfig {
    double doorDensity = 0.05;              // door_density: doors per meter of perimeter
    double windowDensity = 0.3;             // window_density: windows per meter of perimeter
    double edgeSpacing = 1.0;               // edge_spacing: min distance from edge ends
    double doorSpacing = 2.0;               // door_spacing: min distance between doors
    double windowSpacing = 1.5;             // window_spacing: min distance between windows
    double cornerWidth = 0.15;              // corner_width

    double doorMinUsableLength = 0.5;       // door_min_usable_length
    double windowMinUsableLength = 0.3;     // window_min_usable_length
    int maxAttemptsPerElement = 10;         // max_attempts

    nlohmann::json styleParams = nlohmann::json::object();

    // Throws InvalidConfiguration for negative/non-finite values
    void validate() const;

    // Throws InvalidConfiguration if a recognized key has the wrong type
    static GenerationConfig fromJson(const nlohmann::json& j);
    static GenerationConfig loadFromFile(const std::string& path);

    nlohmann::json toJson() const;

    bool operator==(const GenerationConfig& other) const;
};

} // namespace facade_generator
