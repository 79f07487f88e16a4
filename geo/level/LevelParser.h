// Reads level files into a LevelGrid.
//
// Accepted layout: an optional "data=" marker line (case-insensitive), then rows of five
// comma-separated integers, optionally comma-terminated and separated by blank lines.
// Without a marker every comma-bearing line is treated as data.
#pragma once

#include <istream>
#include <string>

#include "../../core/Status.h"
#include "LevelGrid.h"

namespace GeoBuffer::Level {

struct ParseOptions {
    // Lenient parsing drops malformed candidate lines; strict parsing fails on the first one.
    bool strict{false};
};

class LevelParser {
public:
    static Core::Status parseFile(const std::string& path, LevelGrid& outGrid, const ParseOptions& options = {});
    static Core::Status parseStream(std::istream& in, LevelGrid& outGrid, const ParseOptions& options = {});
};

}  // namespace GeoBuffer::Level
