#include "facade_generator/GenerationConfig.hpp"
#include "facade_generator/Errors.hpp"
#include <SDL3/SDL_log.h>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace facade_generator {

namespace {

struct NumberKey {
    const char* key;
    double GenerationConfig::*field;
};

const NumberKey kNumberKeys[] = {
    {"door_density", &GenerationConfig::doorDensity},
    {"window_density", &GenerationConfig::windowDensity},
    {"edge_spacing", &GenerationConfig::edgeSpacing},
    {"door_spacing", &GenerationConfig::doorSpacing},
    {"window_spacing", &GenerationConfig::windowSpacing},
    {"corner_width", &GenerationConfig::cornerWidth},
    {"door_min_usable_length", &GenerationConfig::doorMinUsableLength},
    {"window_min_usable_length", &GenerationConfig::windowMinUsableLength},
};

constexpr const char* kMaxAttemptsKey = "max_attempts";

bool isRecognizedKey(const std::string& key) {
    if (key == kMaxAttemptsKey) return true;
    for (const auto& entry : kNumberKeys) {
        if (key == entry.key) return true;
    }
    return false;
}

void checkNonNegative(const char* key, double value) {
    if (!std::isfinite(value) || value < 0.0) {
        std::ostringstream msg;
        msg << "GenerationConfig: " << key << " must be finite and non-negative, got " << value;
        throw InvalidConfiguration(msg.str());
    }
}

} // namespace

void GenerationConfig::validate() const {
    for (const auto& entry : kNumberKeys) {
        checkNonNegative(entry.key, this->*entry.field);
    }
    if (maxAttemptsPerElement <= 0) {
        throw InvalidConfiguration("GenerationConfig: max_attempts must be positive, got " +
                                   std::to_string(maxAttemptsPerElement));
    }
    if (!styleParams.is_object()) {
        throw InvalidConfiguration("GenerationConfig: style parameters must be a JSON object");
    }
}

GenerationConfig GenerationConfig::fromJson(const json& j) {
    if (!j.is_object()) {
        throw InvalidConfiguration(std::string("GenerationConfig: expected a JSON object, got ") + j.type_name());
    }

    GenerationConfig config;
    for (const auto& entry : kNumberKeys) {
        auto it = j.find(entry.key);
        if (it == j.end()) continue;
        if (!it->is_number()) {
            throw InvalidConfiguration(std::string("GenerationConfig: ") + entry.key + " must be a number");
        }
        config.*entry.field = it->get<double>();
    }

    auto attempts = j.find(kMaxAttemptsKey);
    if (attempts != j.end()) {
        if (!attempts->is_number_integer()) {
            throw InvalidConfiguration("GenerationConfig: max_attempts must be an integer");
        }
        config.maxAttemptsPerElement = attempts->get<int>();
    }

    // Everything else is passed through to the property generators
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!isRecognizedKey(it.key())) {
            config.styleParams[it.key()] = it.value();
        }
    }

    config.validate();
    return config;
}

GenerationConfig GenerationConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("GenerationConfig: failed to open config file: " + path);
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::parse_error& e) {
        throw InvalidConfiguration("GenerationConfig: JSON parse error in " + path + ": " + e.what());
    }

    GenerationConfig config = fromJson(j);
    SDL_Log("GenerationConfig: loaded %s (%zu style parameters)", path.c_str(), config.styleParams.size());
    return config;
}

json GenerationConfig::toJson() const {
    json j = styleParams.is_object() ? styleParams : json::object();
    for (const auto& entry : kNumberKeys) {
        j[entry.key] = this->*entry.field;
    }
    j[kMaxAttemptsKey] = maxAttemptsPerElement;
    return j;
}

bool GenerationConfig::operator==(const GenerationConfig& other) const {
    for (const auto& entry : kNumberKeys) {
        if (this->*entry.field != other.*entry.field) return false;
    }
    return maxAttemptsPerElement == other.maxAttemptsPerElement && styleParams == other.styleParams;
}

} // namespace facade_generator
