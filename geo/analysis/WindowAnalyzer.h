// Sliding-window density scan over a LevelGrid.
#pragma once

#include <string>
#include <unordered_map>

#include "../../core/Status.h"
#include "../level/LevelGrid.h"
#include "../mapping/ConversionMap.h"

namespace GeoBuffer::Analysis {

constexpr int kDefaultWindowSize = 200;

// Highest count of each mapped id seen in any single window. Every mapped id has an entry.
using MaxCountTable = std::unordered_map<int, int>;

class WindowAnalyzer {
public:
    // Slides a window of windowSize rows one row at a time and records, per mapped id,
    // the largest count found in any window. A grid shorter than the window yields all zeros.
    static Core::Status analyze(const Level::LevelGrid& grid,
                                int windowSize,
                                const Mapping::ConversionMap& map,
                                MaxCountTable& outCounts);

    // Parses a user-entered window size. Rejects non-integers and values below 1.
    static Core::Status parseWindowSize(const std::string& text, int& outSize);
};

}  // namespace GeoBuffer::Analysis
