#include "WindowAnalyzer.h"

#include <cctype>
#include <charconv>

#include "../../core/Logger.h"

namespace GeoBuffer::Analysis {

Core::Status WindowAnalyzer::analyze(const Level::LevelGrid& grid,
                                     int windowSize,
                                     const Mapping::ConversionMap& map,
                                     MaxCountTable& outCounts) {
    if (windowSize <= 0) {
        return Core::Status::configError("window size must be a positive integer, got " + std::to_string(windowSize));
    }

    MaxCountTable maxCounts;
    maxCounts.reserve(map.size());
    for (int id : map.ids()) maxCounts[id] = 0;

    const std::size_t total = grid.size();
    const std::size_t window = static_cast<std::size_t>(windowSize);
    if (total < window) {
        Core::logDebug("WindowAnalyzer: " + std::to_string(total) + " rows is shorter than window " +
                       std::to_string(windowSize) + "; no windows scanned");
        outCounts = std::move(maxCounts);
        return Core::Status::success();
    }

    // Each window is recounted from scratch.
    std::unordered_map<int, int> freq;
    for (std::size_t start = 0; start + window <= total; ++start) {
        freq.clear();
        for (std::size_t r = start; r < start + window; ++r) {
            for (int item : grid[r]) {
                if (map.contains(item)) ++freq[item];
            }
        }
        for (const auto& [id, count] : freq) {
            int& best = maxCounts[id];
            if (count > best) best = count;
        }
    }

    Core::logDebug("WindowAnalyzer: scanned " + std::to_string(total - window + 1) + " window(s) of " +
                   std::to_string(windowSize) + " rows");
    outCounts = std::move(maxCounts);
    return Core::Status::success();
}

Core::Status WindowAnalyzer::parseWindowSize(const std::string& text, int& outSize) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    if (begin < end && text[begin] == '+') ++begin;

    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data() + begin, text.data() + end, value);
    if (begin == end || ec != std::errc() || ptr != text.data() + end) {
        return Core::Status::configError("window size must be an integer, got \"" + text + "\"");
    }
    if (value <= 0) {
        return Core::Status::configError("window size must be positive, got " + std::to_string(value));
    }
    outSize = value;
    return Core::Status::success();
}

}  // namespace GeoBuffer::Analysis
