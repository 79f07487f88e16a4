#include "GeneratorSettings.h"

#include <fstream>

#include <nlohmann/json.hpp>

#include "../core/JsonValues.h"
#include "../core/Logger.h"

namespace GeoBuffer {

namespace {
void readString(const nlohmann::json& j, const char* key, std::string& dst) {
    if (!j.contains(key)) return;
    if (j[key].is_string()) {
        dst = j[key].get<std::string>();
    } else {
        Core::logWarn(std::string("GeneratorSettings: \"") + key + "\" must be a string; using default");
    }
}
}  // namespace

std::optional<GeneratorSettings> GeneratorSettingsLoader::load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return std::nullopt;
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::exception& e) {
        Core::logWarn("GeneratorSettings: failed to parse " + path + ": " + e.what());
        return std::nullopt;
    }
    if (!j.is_object()) {
        Core::logWarn("GeneratorSettings: " + path + " is not an object");
        return std::nullopt;
    }

    GeneratorSettings settings{};
    readString(j, "conversionMap", settings.conversionMapPath);
    readString(j, "roller", settings.roller);
    readString(j, "input", settings.inputPath);
    readString(j, "output", settings.outputPath);

    if (j.contains("rollerMappings")) {
        const auto& arr = j["rollerMappings"];
        if (arr.is_string()) {
            settings.rollerMappingPaths = {arr.get<std::string>()};
        } else if (arr.is_array()) {
            settings.rollerMappingPaths.clear();
            for (const auto& v : arr) {
                if (v.is_string()) settings.rollerMappingPaths.push_back(v.get<std::string>());
            }
        } else {
            Core::logWarn("GeneratorSettings: \"rollerMappings\" must be a path or list of paths; using default");
        }
    }
    if (j.contains("windowSize")) {
        const auto window = Core::readInt(j["windowSize"]);
        if (window && *window > 0) {
            settings.windowSize = *window;
        } else {
            Core::logWarn("GeneratorSettings: \"windowSize\" must be a positive integer; using " +
                          std::to_string(settings.windowSize));
        }
    }
    if (j.contains("addGeoBuffer0")) {
        if (j["addGeoBuffer0"].is_boolean()) {
            settings.addGeoBuffer0 = j["addGeoBuffer0"].get<bool>();
        } else {
            Core::logWarn("GeneratorSettings: \"addGeoBuffer0\" must be true or false; using default");
        }
    }
    if (j.contains("strictParsing")) {
        if (j["strictParsing"].is_boolean()) {
            settings.strictParsing = j["strictParsing"].get<bool>();
        } else {
            Core::logWarn("GeneratorSettings: \"strictParsing\" must be true or false; using default");
        }
    }

    return settings;
}

}  // namespace GeoBuffer
