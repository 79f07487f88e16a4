#include "GeoBufferGenerator.h"

#include "../core/Logger.h"
#include "analysis/GeoBufferBuilder.h"
#include "analysis/PresetGeoBuffer.h"
#include "level/LevelParser.h"
#include "mapping/ConversionMapLoader.h"
#include "output/GeoBufferWriter.h"

namespace GeoBuffer {

GeoBufferGenerator::GeoBufferGenerator(Mapping::ConversionMap map) : map_(std::move(map)) {}

Core::Status GeoBufferGenerator::loadMappings(const std::string& conversionMapPath,
                                              const std::vector<std::string>& rollerPaths) {
    Mapping::ConversionMap map;
    auto status = Mapping::ConversionMapLoader::loadGroups(conversionMapPath, map);
    if (!status.ok()) return status;

    if (map.empty()) {
        Core::logWarn("Conversion map " + conversionMapPath + " maps no item ids; every run will come up empty.");
    }

    if (auto rollers = Mapping::ConversionMapLoader::loadRollerMappings(rollerPaths)) {
        map.setRollerMappings(std::move(*rollers));
        map.applyRollerOverride(Mapping::kDefaultRollerName);
    } else {
        Core::logInfo("No roller mappings found; roller ids keep their conversion map categories.");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    map_ = std::move(map);
    Core::logInfo("Loaded " + std::to_string(map_.size()) + " item ids from " + conversionMapPath);
    return Core::Status::success();
}

bool GeoBufferGenerator::selectRoller(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!map_.applyRollerOverride(name)) {
        Core::logWarn("Roller \"" + name + "\" ignored: no roller mappings loaded.");
        return false;
    }
    const auto to = map_.resolveRoller(name);
    Core::logInfo("Roller \"" + name + "\" -> (" + std::to_string(to.x) + ", " + std::to_string(to.y) + ")");
    return true;
}

std::vector<std::string> GeoBufferGenerator::rollerNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return map_.rollerNames();
}

Mapping::ConversionMap GeoBufferGenerator::mappingSnapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return map_;
}

RunResult GeoBufferGenerator::run(const RunRequest& request) {
    RunResult result{};
    if (request.inputPath.empty()) {
        result.status = Core::Status::configError("Please select an input file.");
        return result;
    }
    if (request.outputPath.empty()) {
        result.status = Core::Status::configError("Please select an output file.");
        return result;
    }
    if (request.windowSize <= 0) {
        result.status = Core::Status::configError("Window size must be a positive integer.");
        return result;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    Level::LevelGrid grid;
    Level::ParseOptions parseOptions{};
    parseOptions.strict = request.strictParsing;
    result.status = Level::LevelParser::parseFile(request.inputPath, grid, parseOptions);
    if (!result.status.ok()) return result;
    result.rowCount = grid.size();
    if (grid.empty()) {
        result.status = Core::Status::empty("No valid level data found in the file.");
        return result;
    }
    Core::logDebug("Parsed " + std::to_string(grid.size()) + " rows from " + request.inputPath);

    Analysis::MaxCountTable maxCounts;
    result.status = Analysis::WindowAnalyzer::analyze(grid, request.windowSize, map_, maxCounts);
    if (!result.status.ok()) return result;

    auto computed = Analysis::buildGeoBufferList(map_, maxCounts);
    Core::logDebug(std::to_string(computed.size()) + " categories from level data");
    result.entries = Analysis::injectPreset(computed, request.addGeoBuffer0);
    if (result.entries.empty()) {
        result.status = Core::Status::empty("No matching item IDs were found in the level data.");
        return result;
    }

    result.status = Output::GeoBufferWriter::writeFile(request.outputPath, result.entries);
    if (!result.status.ok()) return result;

    Core::logInfo("GeoBuffer information written to: " + request.outputPath + " (" +
                  std::to_string(result.entries.size()) + " entries)");
    return result;
}

}  // namespace GeoBuffer
