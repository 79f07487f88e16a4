// Run settings for the generator, loaded from a JSON file and overridable from the command line.
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "analysis/WindowAnalyzer.h"
#include "mapping/ConversionMapLoader.h"

namespace GeoBuffer {

struct GeneratorSettings {
    std::string conversionMapPath{"conversion_map.json"};
    std::vector<std::string> rollerMappingPaths = Mapping::ConversionMapLoader::defaultRollerFiles();
    std::string roller{Mapping::kDefaultRollerName};
    int windowSize{Analysis::kDefaultWindowSize};
    bool addGeoBuffer0{true};
    bool strictParsing{false};
    std::string inputPath;
    std::string outputPath;
};

class GeneratorSettingsLoader {
public:
    // Missing file -> nullopt. Unparsable file -> nullopt with a warning.
    // Fields with the wrong type keep their defaults.
    static std::optional<GeneratorSettings> load(const std::string& path);
};

}  // namespace GeoBuffer
