#include "LevelParser.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <optional>
#include <string_view>
#include <vector>

#include "../../core/Logger.h"

namespace GeoBuffer::Level {

namespace {
std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

bool isDataMarker(std::string_view line) {
    constexpr std::string_view kMarker = "data=";
    if (line.size() < kMarker.size()) return false;
    for (std::size_t i = 0; i < kMarker.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(line[i])) != kMarker[i]) return false;
    }
    return true;
}

std::optional<int> parseInt(std::string_view token) {
    token = trim(token);
    if (!token.empty() && token.front() == '+') {
        token.remove_prefix(1);
        if (!token.empty() && token.front() == '-') return std::nullopt;
    }
    if (token.empty()) return std::nullopt;
    int value = 0;
    const char* end = token.data() + token.size();
    auto [ptr, ec] = std::from_chars(token.data(), end, value);
    if (ec != std::errc() || ptr != end) return std::nullopt;
    return value;
}

// Splits a candidate line into a row; empty tokens from doubled or trailing commas are ignored.
std::optional<Row> parseRow(std::string_view line) {
    while (!line.empty() && line.back() == ',') line.remove_suffix(1);

    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (start <= line.size()) {
        std::size_t comma = line.find(',', start);
        if (comma == std::string_view::npos) comma = line.size();
        std::string_view part = line.substr(start, comma - start);
        if (!part.empty()) parts.push_back(part);
        start = comma + 1;
    }
    if (parts.size() != kRowWidth) return std::nullopt;

    Row row{};
    for (std::size_t i = 0; i < kRowWidth; ++i) {
        auto v = parseInt(parts[i]);
        if (!v) return std::nullopt;
        row[i] = *v;
    }
    return row;
}
}  // namespace

Core::Status LevelParser::parseFile(const std::string& path, LevelGrid& outGrid, const ParseOptions& options) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return Core::Status::ioError("cannot open level file " + path);
    }
    auto status = parseStream(in, outGrid, options);
    if (status.code == Core::StatusCode::IOError) {
        status.message += " (" + path + ")";
    }
    return status;
}

Core::Status LevelParser::parseStream(std::istream& in, LevelGrid& outGrid, const ParseOptions& options) {
    LevelGrid grid;
    bool dataStarted = false;
    int lineNo = 0;
    int dropped = 0;
    std::string line;
    while (std::getline(in, line)) {
        ++lineNo;
        const std::string_view stripped = trim(line);
        if (stripped.empty()) continue;
        if (isDataMarker(stripped)) {
            dataStarted = true;
            continue;
        }
        if (!dataStarted && stripped.find(',') == std::string_view::npos) continue;

        auto row = parseRow(stripped);
        if (!row) {
            if (options.strict) {
                return Core::Status::malformed("line " + std::to_string(lineNo) + ": expected " +
                                               std::to_string(kRowWidth) + " integers, got \"" +
                                               std::string(stripped) + "\"");
            }
            ++dropped;
            continue;
        }
        grid.push_back(*row);
    }
    if (in.bad()) {
        return Core::Status::ioError("read failure in level data");
    }

    if (dropped > 0) {
        Core::logDebug("LevelParser: dropped " + std::to_string(dropped) + " malformed line(s)");
    }
    outGrid = std::move(grid);
    return Core::Status::success();
}

}  // namespace GeoBuffer::Level
