// Runs the whole conversion: parse -> window scan -> category fold -> preset -> write.
#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

#include "../core/Status.h"
#include "analysis/GeoBufferEntry.h"
#include "analysis/WindowAnalyzer.h"
#include "mapping/ConversionMap.h"

namespace GeoBuffer {

struct RunRequest {
    std::string inputPath;
    std::string outputPath;
    int windowSize{Analysis::kDefaultWindowSize};
    bool addGeoBuffer0{true};
    bool strictParsing{false};
};

struct RunResult {
    Core::Status status;
    std::size_t rowCount{0};
    Analysis::GeoBufferList entries;  // what was (or would have been) written
};

// Owns the conversion map. Roller selection and runs are serialized on one mutex so an
// override never lands in the middle of a scan.
class GeoBufferGenerator {
public:
    GeoBufferGenerator() = default;
    explicit GeoBufferGenerator(Mapping::ConversionMap map);

    // Loads the group map, then the first readable roller file, then applies "Default".
    Core::Status loadMappings(const std::string& conversionMapPath, const std::vector<std::string>& rollerPaths);

    // Returns false when no roller configuration is loaded (the map is unchanged).
    bool selectRoller(const std::string& name);
    std::vector<std::string> rollerNames() const;

    Mapping::ConversionMap mappingSnapshot() const;

    RunResult run(const RunRequest& request);

private:
    mutable std::mutex mutex_{};
    Mapping::ConversionMap map_{};
};

}  // namespace GeoBuffer
