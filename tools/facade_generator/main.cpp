#include "facade_generator/GenerationConfig.hpp"
#include "facade_generator/building/Building.hpp"
#include "facade_generator/building/ElementsJson.hpp"
#include "facade_generator/utils/CoordinateSystem.hpp"
#include <SDL3/SDL_log.h>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <string>
#include <vector>

using namespace facade_generator;

void printUsage(const char* programName) {
    SDL_Log("Usage: %s [options]", programName);
    SDL_Log(" ");
    SDL_Log("Options:");
    SDL_Log("  -o, --output <path>       Output JSON file (default: facade.json)");
    SDL_Log("  -s, --seed <number>       Building seed (default: 12345)");
    SDL_Log("  -f, --floors <number>     Number of floors (default: 1)");
    SDL_Log("  --shape <name>            Footprint: square, l, u (default: square)");
    SDL_Log("  --size <meters>           Footprint extent (default: 10)");
    SDL_Log("  --floor-height <meters>   Height of every floor (default: 3)");
    SDL_Log("  --config <path>           Generation config JSON");
    SDL_Log("  --door-density <n>        Doors per meter of perimeter");
    SDL_Log("  --window-density <n>      Windows per meter of perimeter");
    SDL_Log("  --up-axis <z|y>           Up axis of exported 3D positions (default: z)");
    SDL_Log("  -h, --help                Show this help message");
}

// CCW outlines in the XY plane, origin at the lower-left corner
std::vector<glm::dvec2> makeFootprint(const std::string& shape, double s) {
    if (shape == "l") {
        return {{0, 0}, {s, 0}, {s, s * 0.5}, {s * 0.5, s * 0.5}, {s * 0.5, s}, {0, s}};
    }
    if (shape == "u") {
        double third = s / 3.0;
        return {{0, 0}, {s, 0}, {s, s}, {2 * third, s}, {2 * third, third},
                {third, third}, {third, s}, {0, s}};
    }
    return {{0, 0}, {s, 0}, {s, s}, {0, s}};
}

int run(int argc, char* argv[]) {
    std::string outputPath = "facade.json";
    std::string configPath;
    std::string shape = "square";
    uint32_t seed = 12345;
    int numFloors = 1;
    double size = 10.0;
    double floorHeight = 3.0;
    double doorDensity = -1.0;
    double windowDensity = -1.0;
    utils::UpAxis upAxis = utils::UpAxis::Z;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        }
        else if ((strcmp(argv[i], "-o") == 0 || strcmp(argv[i], "--output") == 0) && i + 1 < argc) {
            outputPath = argv[++i];
        }
        else if ((strcmp(argv[i], "-s") == 0 || strcmp(argv[i], "--seed") == 0) && i + 1 < argc) {
            seed = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
        }
        else if ((strcmp(argv[i], "-f") == 0 || strcmp(argv[i], "--floors") == 0) && i + 1 < argc) {
            numFloors = std::atoi(argv[++i]);
            if (numFloors < 1) numFloors = 1;
        }
        else if (strcmp(argv[i], "--shape") == 0 && i + 1 < argc) {
            ++i;
            if (strcmp(argv[i], "square") == 0 || strcmp(argv[i], "l") == 0 || strcmp(argv[i], "u") == 0) {
                shape = argv[i];
            } else {
                SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Unknown shape: %s", argv[i]);
            }
        }
        else if (strcmp(argv[i], "--size") == 0 && i + 1 < argc) {
            size = std::atof(argv[++i]);
        }
        else if (strcmp(argv[i], "--floor-height") == 0 && i + 1 < argc) {
            floorHeight = std::atof(argv[++i]);
        }
        else if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            configPath = argv[++i];
        }
        else if (strcmp(argv[i], "--door-density") == 0 && i + 1 < argc) {
            doorDensity = std::atof(argv[++i]);
        }
        else if (strcmp(argv[i], "--window-density") == 0 && i + 1 < argc) {
            windowDensity = std::atof(argv[++i]);
        }
        else if (strcmp(argv[i], "--up-axis") == 0 && i + 1 < argc) {
            ++i;
            if (auto axis = utils::CoordinateSystem::parseAxis(argv[i])) {
                upAxis = *axis;
            } else {
                SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Unknown up axis: %s", argv[i]);
            }
        }
        else {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Unknown option: %s", argv[i]);
        }
    }

    GenerationConfig config;
    if (!configPath.empty()) {
        config = GenerationConfig::loadFromFile(configPath);
    }
    if (doorDensity >= 0.0) config.doorDensity = doorDensity;
    if (windowDensity >= 0.0) config.windowDensity = windowDensity;
    config.validate();

    SDL_Log("Facade Generator");
    SDL_Log("================");
    SDL_Log("Seed: %u", seed);
    SDL_Log("Floors: %d", numFloors);
    SDL_Log("Shape: %s (%.1f m)", shape.c_str(), size);
    SDL_Log("Door density: %.3f / m", config.doorDensity);
    SDL_Log("Window density: %.3f / m", config.windowDensity);
    SDL_Log(" ");

    std::vector<std::vector<glm::dvec2>> footprints(numFloors, makeFootprint(shape, size));
    building::Building result(footprints, seed, {}, floorHeight);
    result.setCoordinateSystem(utils::CoordinateSystem(upAxis));
    result.generateAll(config);

    for (size_t f = 0; f < result.numFloors(); ++f) {
        const auto& floor = result.floor(f);
        const auto& elements = *floor.cached();
        const auto& stats = floor.lastStats();
        SDL_Log("Floor %zu (z %.2f-%.2f): %zu/%zu doors, %zu/%zu windows, %zu corners",
                f, result.floorZBase(f), result.floorZTop(f),
                elements.doors.size(), stats.doorsRequested,
                elements.windows.size(), stats.windowsRequested,
                elements.corners.size());
    }

    building::saveBuilding(result, outputPath);
    return 0;
}

int main(int argc, char* argv[]) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "facade_generator: %s", e.what());
        return 1;
    }
}
