#include <iostream>
#include <string>
#include <vector>

#include "../core/Logger.h"
#include "../geo/GeneratorSettings.h"
#include "../geo/GeoBufferGenerator.h"

namespace {
constexpr const char* kDefaultSettingsFile = "geobuffer.json";

void printUsage(const char* exe) {
    std::cout << "Usage: " << exe << " [options]\n"
              << "  -i, --input <file>     level data file\n"
              << "  -o, --output <file>    geoBuffer output file\n"
              << "  -w, --window <rows>    sliding window size (default 200)\n"
              << "  -r, --roller <name>    roller mapping to apply (default \"Default\")\n"
              << "      --preset           prepend the GeoBuffer0 preset (default)\n"
              << "      --no-preset        do not prepend the GeoBuffer0 preset\n"
              << "      --strict           fail on malformed data lines instead of skipping them\n"
              << "  -c, --config <file>    settings file (default geobuffer.json)\n"
              << "      --map <file>       conversion map (default conversion_map.json)\n"
              << "      --rollers <file>   roller mapping file\n"
              << "      --list-rollers     print roller names and exit\n"
              << "  -v, --verbose          debug logging\n"
              << "  -q, --quiet            errors only\n"
              << "  -h, --help             this text\n";
}

int exitCodeFor(GeoBuffer::Core::StatusCode code) {
    using GeoBuffer::Core::StatusCode;
    switch (code) {
        case StatusCode::Ok:
            return 0;
        case StatusCode::IOError:
            return 1;
        case StatusCode::ConfigurationError:
            return 2;
        case StatusCode::EmptyResult:
            return 3;
        case StatusCode::MalformedData:
        default:
            return 4;
    }
}

struct CliOptions {
    std::string configPath{kDefaultSettingsFile};
    bool configExplicit{false};
    std::string input;
    std::string output;
    std::string window;
    std::string roller;
    std::string mapPath;
    std::string rollerPath;
    int preset{-1};  // -1 = from settings
    bool strict{false};
    bool listRollers{false};
    bool help{false};
};

bool parseArgs(int argc, char** argv, CliOptions& out) {
    auto needValue = [&](int& i, const std::string& flag, std::string& dst) {
        if (i + 1 >= argc) {
            GeoBuffer::Core::logError("Missing value for " + flag);
            return false;
        }
        dst = argv[++i];
        return true;
    };

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            out.help = true;
        } else if (arg == "-i" || arg == "--input") {
            if (!needValue(i, arg, out.input)) return false;
        } else if (arg == "-o" || arg == "--output") {
            if (!needValue(i, arg, out.output)) return false;
        } else if (arg == "-w" || arg == "--window") {
            if (!needValue(i, arg, out.window)) return false;
        } else if (arg == "-r" || arg == "--roller") {
            if (!needValue(i, arg, out.roller)) return false;
        } else if (arg == "-c" || arg == "--config") {
            if (!needValue(i, arg, out.configPath)) return false;
            out.configExplicit = true;
        } else if (arg == "--map") {
            if (!needValue(i, arg, out.mapPath)) return false;
        } else if (arg == "--rollers") {
            if (!needValue(i, arg, out.rollerPath)) return false;
        } else if (arg == "--preset") {
            out.preset = 1;
        } else if (arg == "--no-preset") {
            out.preset = 0;
        } else if (arg == "--strict") {
            out.strict = true;
        } else if (arg == "--list-rollers") {
            out.listRollers = true;
        } else if (arg == "-v" || arg == "--verbose") {
            GeoBuffer::Core::Logger::setMinLevel(GeoBuffer::Core::LogLevel::Debug);
        } else if (arg == "-q" || arg == "--quiet") {
            GeoBuffer::Core::Logger::setMinLevel(GeoBuffer::Core::LogLevel::Error);
        } else {
            GeoBuffer::Core::logError("Unknown option: " + arg);
            return false;
        }
    }
    return true;
}
}  // namespace

int main(int argc, char** argv) {
    using namespace GeoBuffer;

    CliOptions cli;
    if (!parseArgs(argc, argv, cli)) {
        printUsage(argv[0]);
        return exitCodeFor(Core::StatusCode::ConfigurationError);
    }
    if (cli.help) {
        printUsage(argv[0]);
        return 0;
    }

    GeneratorSettings settings{};
    if (auto loaded = GeneratorSettingsLoader::load(cli.configPath)) {
        settings = *loaded;
    } else if (cli.configExplicit) {
        Core::logError("Cannot read settings file " + cli.configPath);
        return exitCodeFor(Core::StatusCode::ConfigurationError);
    } else {
        Core::logDebug("No " + cli.configPath + "; using built-in settings.");
    }

    if (!cli.input.empty()) settings.inputPath = cli.input;
    if (!cli.output.empty()) settings.outputPath = cli.output;
    if (!cli.roller.empty()) settings.roller = cli.roller;
    if (!cli.mapPath.empty()) settings.conversionMapPath = cli.mapPath;
    if (!cli.rollerPath.empty()) settings.rollerMappingPaths = {cli.rollerPath};
    if (cli.preset >= 0) settings.addGeoBuffer0 = cli.preset == 1;
    if (cli.strict) settings.strictParsing = true;
    if (!cli.window.empty()) {
        auto status = Analysis::WindowAnalyzer::parseWindowSize(cli.window, settings.windowSize);
        if (!status.ok()) {
            Core::logError(std::string(Core::toString(status.code)) + ": " + status.message);
            return exitCodeFor(status.code);
        }
    }

    GeoBufferGenerator generator;
    auto status = generator.loadMappings(settings.conversionMapPath, settings.rollerMappingPaths);
    if (!status.ok()) {
        Core::logError(std::string(Core::toString(status.code)) + ": " + status.message);
        return exitCodeFor(status.code);
    }

    if (cli.listRollers) {
        if (!generator.mappingSnapshot().hasRollerMappings()) {
            Core::logWarn("No roller mappings loaded; roller ids keep their conversion map categories.");
        }
        for (const auto& name : generator.rollerNames()) {
            std::cout << name << '\n';
        }
        return 0;
    }

    if (settings.roller != Mapping::kDefaultRollerName) {
        generator.selectRoller(settings.roller);
    }

    RunRequest request{};
    request.inputPath = settings.inputPath;
    request.outputPath = settings.outputPath;
    request.windowSize = settings.windowSize;
    request.addGeoBuffer0 = settings.addGeoBuffer0;
    request.strictParsing = settings.strictParsing;

    const auto result = generator.run(request);
    if (!result.status.ok()) {
        if (result.status.code == Core::StatusCode::EmptyResult) {
            Core::logWarn(result.status.message);
        } else {
            Core::logError(std::string(Core::toString(result.status.code)) + ": " + result.status.message);
        }
        return exitCodeFor(result.status.code);
    }
    return 0;
}
