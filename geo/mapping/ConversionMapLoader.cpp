#include "ConversionMapLoader.h"

#include <fstream>

#include <nlohmann/json.hpp>

#include "../../core/JsonValues.h"
#include "../../core/Logger.h"

namespace GeoBuffer::Mapping {

using nlohmann::json;

namespace {
std::optional<Category> readCategory(const json& to) {
    if (!to.is_array() || to.size() < 2) return std::nullopt;
    const auto x = Core::readInt(to[0]);
    const auto y = Core::readInt(to[1]);
    if (!x || !y) return std::nullopt;
    return Category{*x, *y};
}

std::string trimCopy(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}
}  // namespace

Core::Status ConversionMapLoader::loadGroups(const std::string& path, ConversionMap& outMap) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return Core::Status::configError("cannot open conversion map " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const json::exception& e) {
        return Core::Status::configError("failed to parse conversion map " + path + ": " + e.what());
    }
    if (!j.is_array()) {
        return Core::Status::configError("conversion map " + path + " must be a list of groups");
    }

    ConversionMap map;
    std::size_t index = 0;
    for (const auto& group : j) {
        ++index;
        if (!group.is_object() || !group.contains("ids") || !group["ids"].is_array()) {
            Core::logWarn("ConversionMapLoader: group " + std::to_string(index) + " has no ids list; skipped");
            continue;
        }
        auto to = group.contains("to") ? readCategory(group["to"]) : std::nullopt;
        if (!to) {
            Core::logWarn("ConversionMapLoader: group " + std::to_string(index) + " has no valid [x, y] target; skipped");
            continue;
        }
        for (const auto& id : group["ids"]) {
            const auto value = Core::readInt(id);
            if (!value) {
                Core::logWarn("ConversionMapLoader: id " + id.dump() + " in group " + std::to_string(index) +
                              " is not an integer in range");
                continue;
            }
            map.assign(*value, *to);
        }
    }

    Core::logDebug("ConversionMapLoader: " + std::to_string(map.size()) + " ids from " + path);
    outMap = std::move(map);
    return Core::Status::success();
}

std::optional<std::vector<RollerMapping>> ConversionMapLoader::loadRollerMappings(
    const std::vector<std::string>& candidates) {
    for (const auto& path : candidates) {
        std::ifstream in(path);
        if (!in.is_open()) continue;

        json j;
        try {
            in >> j;
        } catch (const json::exception&) {
            Core::logWarn("ConversionMapLoader: failed to parse " + path);
            continue;
        }
        if (!j.is_array()) {
            Core::logWarn("ConversionMapLoader: " + path + " is not a list of roller entries; rollers keep their mapping");
            return std::nullopt;
        }

        std::vector<RollerMapping> out;
        for (const auto& entry : j) {
            if (!entry.is_object()) continue;
            if (!entry.contains("name") || !entry["name"].is_string()) continue;
            std::string name = trimCopy(entry["name"].get<std::string>());
            if (name.empty()) continue;
            auto to = entry.contains("to") ? readCategory(entry["to"]) : std::nullopt;
            if (!to) {
                Core::logWarn("ConversionMapLoader: roller entry \"" + name + "\" has no valid [x, y] target");
                continue;
            }
            out.push_back({std::move(name), *to});
        }
        Core::logDebug("ConversionMapLoader: " + std::to_string(out.size()) + " roller entries from " + path);
        return out;
    }
    return std::nullopt;
}

}  // namespace GeoBuffer::Mapping
