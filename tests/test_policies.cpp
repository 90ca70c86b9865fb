#include <doctest/doctest.h>
#include <cmath>
#include <memory>
#include <string>

#include "facade_generator/Errors.hpp"
#include "facade_generator/GenerationConfig.hpp"
#include "facade_generator/geom/Footprint.hpp"
#include "facade_generator/placement/Policies.hpp"
#include "facade_generator/placement/PropertyGenerators.hpp"
#include "facade_generator/utils/SeedDeriver.hpp"

using namespace facade_generator;
using namespace facade_generator::placement;

static geom::Footprint square(double s) {
    return geom::Footprint({{0, 0}, {s, 0}, {s, s}, {0, s}});
}

TEST_SUITE("DoorPolicy") {
    TEST_CASE("target count is at least one") {
        CHECK(DoorPolicy::targetCount(40.0, 0.05) == 2);
        CHECK(DoorPolicy::targetCount(10.0, 0.05) == 1);
        CHECK(DoorPolicy::targetCount(40.0, 0.0) == 1);
        CHECK(DoorPolicy::targetCount(100.0, 0.1) == 10);
    }

    TEST_CASE("huge densities are clamped") {
        CHECK(DoorPolicy::targetCount(40.0, 1e30) == kMaxTargetCount);
        CHECK(DoorPolicy::targetCount(1e300, 1e300) == 1);
    }

    TEST_CASE("target count grows with density") {
        size_t previous = 0;
        for (double density = 0.0; density <= 1.0; density += 0.05) {
            size_t count = DoorPolicy::targetCount(40.0, density);
            CHECK(count >= previous);
            previous = count;
        }
    }

    TEST_CASE("ground floor gets doors with one main entrance") {
        geom::Footprint fp = square(20.0);
        GenerationConfig config;
        DefaultDoorPropertyGenerator props;

        auto result = DoorPolicy::place(fp, 0, 1234, config, props);
        REQUIRE_FALSE(result.elements.empty());
        CHECK(result.occupancy.totalReserved() == result.elements.size());

        CHECK(result.elements[0].properties.isMainEntrance);
        for (size_t i = 1; i < result.elements.size(); ++i) {
            CHECK_FALSE(result.elements[i].properties.isMainEntrance);
        }
        for (const auto& door : result.elements) {
            CHECK(door.floorIndex == 0);
            CHECK(door.properties.width == doctest::Approx(1.0));
            CHECK(door.properties.height == doctest::Approx(2.1));
            CHECK(door.properties.style == "standard");
        }
    }

    TEST_CASE("upper floors get no doors and an empty map") {
        geom::Footprint fp = square(10.0);
        DefaultDoorPropertyGenerator props;

        for (int floor = 1; floor < 4; ++floor) {
            auto result = DoorPolicy::place(fp, floor, 1234, GenerationConfig{}, props);
            CHECK(result.elements.empty());
            CHECK(result.occupancy.edgeCount() == fp.edgeCount());
            CHECK(result.occupancy.totalReserved() == 0);
            CHECK(result.droppedCount == 0);
        }
    }
}

TEST_SUITE("WindowPolicy") {
    TEST_CASE("target count may be zero") {
        CHECK(WindowPolicy::targetCount(40.0, 0.3) == 12);
        CHECK(WindowPolicy::targetCount(40.0, 0.0) == 0);
        CHECK(WindowPolicy::targetCount(3.0, 0.3) == 0);
    }

    TEST_CASE("huge densities are clamped") {
        CHECK(WindowPolicy::targetCount(40.0, 1e30) == kMaxTargetCount);
        CHECK(WindowPolicy::targetCount(10.0, 1e4) == kMaxTargetCount);
        CHECK(WindowPolicy::targetCount(10.0, 9999.0) == 99990);
    }

    TEST_CASE("zero density places nothing") {
        geom::Footprint fp = square(10.0);
        GenerationConfig config;
        config.windowDensity = 0.0;

        auto result = WindowPolicy::place(fp, 0, 55, config, OccupancyMap(fp.edgeCount()),
                                          DefaultWindowPropertyGenerator{});
        CHECK(result.elements.empty());
        CHECK(result.droppedCount == 0);
    }

    TEST_CASE("windows keep clear of doors") {
        geom::Footprint fp = square(12.0);
        GenerationConfig config;

        auto doors = DoorPolicy::place(fp, 0, 8, config, DefaultDoorPropertyGenerator{});
        auto windows = WindowPolicy::place(fp, 0, 9, config, doors.occupancy, DefaultWindowPropertyGenerator{});

        CHECK(windows.occupancy.totalReserved() == doors.elements.size() + windows.elements.size());

        const double minGap = (config.doorSpacing + config.windowSpacing) / 2.0;
        for (const auto& w : windows.elements) {
            for (const auto& d : doors.elements) {
                if (w.edgeIndex == d.edgeIndex) {
                    CHECK(std::abs(w.offset - d.offset) > minGap);
                }
            }
        }
    }

    TEST_CASE("default window properties") {
        geom::Footprint fp = square(10.0);
        auto result = WindowPolicy::place(fp, 2, 3, GenerationConfig{}, OccupancyMap(fp.edgeCount()),
                                          DefaultWindowPropertyGenerator{});
        REQUIRE_FALSE(result.elements.empty());
        for (const auto& w : result.elements) {
            CHECK(w.floorIndex == 2);
            CHECK(w.properties.width == doctest::Approx(1.2));
            CHECK(w.properties.height == doctest::Approx(1.5));
            CHECK(w.properties.sillHeight == doctest::Approx(0.9));
        }
    }
}

TEST_SUITE("CornerPolicy") {
    TEST_CASE("one corner per vertex with neighbours") {
        geom::Footprint fp({{0, 0}, {10, 0}, {10, 5}, {5, 5}, {5, 10}, {0, 10}});
        auto corners = CornerPolicy::place(fp, 1, 77, GenerationConfig{}, DefaultCornerPropertyGenerator{});

        REQUIRE(corners.size() == fp.vertexCount());
        const auto& v = fp.vertices();
        for (size_t i = 0; i < corners.size(); ++i) {
            CHECK(corners[i].vertexIndex == i);
            CHECK(corners[i].position == v[i]);
            CHECK(corners[i].prevPosition == v[(i + v.size() - 1) % v.size()]);
            CHECK(corners[i].nextPosition == v[(i + 1) % v.size()]);
            CHECK(corners[i].floorIndex == 1);
            CHECK(corners[i].properties.width == doctest::Approx(0.15));
        }
    }

    TEST_CASE("corner count does not depend on the seed") {
        geom::Footprint fp = square(10.0);
        for (uint32_t seed = 0; seed < 20; ++seed) {
            CHECK(CornerPolicy::place(fp, 0, seed, GenerationConfig{}, DefaultCornerPropertyGenerator{}).size() == 4);
        }
    }

    TEST_CASE("corner width follows config and corner_size") {
        geom::Footprint fp = square(10.0);
        GenerationConfig config;
        config.cornerWidth = 0.25;
        auto corners = CornerPolicy::place(fp, 0, 1, config, DefaultCornerPropertyGenerator{});
        CHECK(corners[0].properties.width == doctest::Approx(0.25));

        config.styleParams["corner_size"] = 0.4;
        corners = CornerPolicy::place(fp, 0, 1, config, DefaultCornerPropertyGenerator{});
        CHECK(corners[0].properties.width == doctest::Approx(0.4));
    }
}

TEST_SUITE("PropertyGenerators") {
    TEST_CASE("style parameters override door defaults") {
        GenerationConfig config;
        config.styleParams["door_width"] = 1.4;
        config.styleParams["door_height"] = 2.4;
        config.styleParams["door_style"] = "arched";

        ElementContext context{0, 3, 4, config};
        DoorProperties props = DefaultDoorPropertyGenerator{}.generate(10, context);
        CHECK(props.width == doctest::Approx(1.4));
        CHECK(props.height == doctest::Approx(2.4));
        CHECK(props.style == "arched");
        CHECK_FALSE(props.isMainEntrance);
    }

    TEST_CASE("style list is sampled per element seed") {
        GenerationConfig config;
        config.styleParams["window_styles"] = {"casement", "sash", "bay"};

        DefaultWindowPropertyGenerator gen;
        bool sawOther = false;
        std::string first;
        for (int k = 0; k < 30; ++k) {
            ElementContext context{0, static_cast<size_t>(k), 30, config};
            uint32_t seed = utils::SeedDeriver::derive(5, "window", k);
            WindowProperties props = gen.generate(seed, context);
            CHECK((props.style == "casement" || props.style == "sash" || props.style == "bay"));
            CHECK(gen.generate(seed, context) == props);
            if (k == 0) first = props.style;
            else if (props.style != first) sawOther = true;
        }
        CHECK(sawOther);
    }

    TEST_CASE("style list wins over a single style") {
        GenerationConfig config;
        config.styleParams["corner_style"] = "plain";
        config.styleParams["corner_styles"] = {"quoin"};

        ElementContext context{0, 0, 1, config};
        CHECK(DefaultCornerPropertyGenerator{}.generate(1, context).style == "quoin");
    }

    TEST_CASE("malformed overrides are rejected") {
        GenerationConfig config;
        ElementContext context{0, 0, 1, config};

        config.styleParams["door_width"] = "wide";
        CHECK_THROWS_AS(DefaultDoorPropertyGenerator{}.generate(1, context), InvalidConfiguration);

        config.styleParams = nlohmann::json::object();
        config.styleParams["window_styles"] = "sash";
        CHECK_THROWS_AS(DefaultWindowPropertyGenerator{}.generate(1, context), InvalidConfiguration);

        config.styleParams = nlohmann::json::object();
        config.styleParams["corner_styles"] = {1, 2};
        CHECK_THROWS_AS(DefaultCornerPropertyGenerator{}.generate(1, context), InvalidConfiguration);

        config.styleParams = nlohmann::json::object();
        config.styleParams["sill_height"] = -0.5;
        CHECK_THROWS_AS(DefaultWindowPropertyGenerator{}.generate(1, context), InvalidConfiguration);
    }

    TEST_CASE("null generators resolve to defaults") {
        ElementPropertyGenerators partial;
        partial.door = std::make_shared<DefaultDoorPropertyGenerator>();
        auto resolved = partial.resolved();
        CHECK(resolved.door == partial.door);
        CHECK(resolved.window != nullptr);
        CHECK(resolved.corner != nullptr);
    }
}
