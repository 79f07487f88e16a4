// Loads conversion_map.json and roller_mappings.json.
//
// conversion_map.json: [ { "ids": [1, 2, 3], "to": [x, y] }, ... ]
// roller_mappings.json: [ { "name": "Default", "to": [24, 4] }, ... ]
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../../core/Status.h"
#include "ConversionMap.h"

namespace GeoBuffer::Mapping {

class ConversionMapLoader {
public:
    // Fills outMap from the group list. Later groups override earlier ones for shared ids.
    static Core::Status loadGroups(const std::string& path, ConversionMap& outMap);

    // Tries each candidate in order and uses the first file that parses.
    // Returns nullopt when none could be read or the content is not a list of entries.
    static std::optional<std::vector<RollerMapping>> loadRollerMappings(const std::vector<std::string>& candidates);

    static std::vector<std::string> defaultRollerFiles() { return {"roller_mappings.json", "roller_mapping.json"}; }
};

}  // namespace GeoBuffer::Mapping
