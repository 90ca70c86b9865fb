#include <doctest/doctest.h>
#include <cstdio>
#include <fstream>
#include <limits>
#include <string>

#include "facade_generator/Errors.hpp"
#include "facade_generator/GenerationConfig.hpp"

using namespace facade_generator;
using json = nlohmann::json;

TEST_SUITE("GenerationConfig") {
    TEST_CASE("defaults") {
        GenerationConfig config;
        CHECK(config.doorDensity == doctest::Approx(0.05));
        CHECK(config.windowDensity == doctest::Approx(0.3));
        CHECK(config.edgeSpacing == doctest::Approx(1.0));
        CHECK(config.doorSpacing == doctest::Approx(2.0));
        CHECK(config.windowSpacing == doctest::Approx(1.5));
        CHECK(config.cornerWidth == doctest::Approx(0.15));
        CHECK(config.doorMinUsableLength == doctest::Approx(0.5));
        CHECK(config.windowMinUsableLength == doctest::Approx(0.3));
        CHECK(config.maxAttemptsPerElement == 10);
        CHECK(config.styleParams.is_object());
        CHECK(config.styleParams.empty());
        CHECK_NOTHROW(config.validate());
    }

    TEST_CASE("empty object gives defaults") {
        CHECK(GenerationConfig::fromJson(json::object()) == GenerationConfig{});
    }

    TEST_CASE("recognised keys are typed, the rest pass through") {
        json j = {
            {"door_density", 0.1},
            {"window_spacing", 2},
            {"max_attempts", 25},
            {"door_style", "arched"},
            {"window_styles", {"sash", "casement"}},
            {"corner_size", 0.3},
        };

        GenerationConfig config = GenerationConfig::fromJson(j);
        CHECK(config.doorDensity == doctest::Approx(0.1));
        CHECK(config.windowSpacing == doctest::Approx(2.0));
        CHECK(config.maxAttemptsPerElement == 25);
        CHECK(config.windowDensity == doctest::Approx(0.3));

        CHECK(config.styleParams.size() == 3);
        CHECK(config.styleParams["door_style"] == "arched");
        CHECK(config.styleParams["window_styles"].size() == 2);
        CHECK_FALSE(config.styleParams.contains("door_density"));
        CHECK_FALSE(config.styleParams.contains("max_attempts"));
    }

    TEST_CASE("wrongly typed keys are rejected") {
        CHECK_THROWS_AS(GenerationConfig::fromJson(json{{"door_density", "high"}}), InvalidConfiguration);
        CHECK_THROWS_AS(GenerationConfig::fromJson(json{{"max_attempts", 2.5}}), InvalidConfiguration);
        CHECK_THROWS_AS(GenerationConfig::fromJson(json::array({1, 2})), InvalidConfiguration);
    }

    TEST_CASE("out of range values are rejected") {
        CHECK_THROWS_AS(GenerationConfig::fromJson(json{{"window_density", -0.1}}), InvalidConfiguration);
        CHECK_THROWS_AS(GenerationConfig::fromJson(json{{"max_attempts", 0}}), InvalidConfiguration);

        GenerationConfig config;
        config.edgeSpacing = std::numeric_limits<double>::quiet_NaN();
        CHECK_THROWS_AS(config.validate(), InvalidConfiguration);

        config = GenerationConfig{};
        config.styleParams = json::array();
        CHECK_THROWS_AS(config.validate(), InvalidConfiguration);
    }

    TEST_CASE("toJson feeds back into fromJson") {
        GenerationConfig config;
        config.doorDensity = 0.08;
        config.maxAttemptsPerElement = 4;
        config.styleParams["door_styles"] = {"panel", "glazed"};

        json j = config.toJson();
        CHECK(j["door_density"] == 0.08);
        CHECK(j["door_styles"].size() == 2);
        CHECK(GenerationConfig::fromJson(j) == config);
    }

    TEST_CASE("loadFromFile") {
        const std::string path = "facade_generator_test_config.json";
        {
            std::ofstream out(path);
            out << R"({"door_density": 0.2, "sill_height": 1.1})";
        }

        GenerationConfig config = GenerationConfig::loadFromFile(path);
        CHECK(config.doorDensity == doctest::Approx(0.2));
        CHECK(config.styleParams["sill_height"] == 1.1);

        {
            std::ofstream out(path);
            out << "{ not json";
        }
        CHECK_THROWS_AS(GenerationConfig::loadFromFile(path), InvalidConfiguration);

        std::remove(path.c_str());
        CHECK_THROWS_AS(GenerationConfig::loadFromFile("does/not/exist.json"), std::runtime_error);
    }
}
