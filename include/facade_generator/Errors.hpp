#pragma once

#include <stdexcept>
#include <string>

namespace facade_generator {

/**
 * Thrown for rejected generation parameters or building setup (negative
 * densities, floor height lists that do not match the floor count, badly
 * typed style overrides).
 */
class InvalidConfiguration : public std::invalid_argument {
public:
    explicit InvalidConfiguration(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace facade_generator
