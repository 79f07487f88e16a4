// Conversion map loading and roller overrides.
#include <cassert>
#include <filesystem>

#include "../geo/mapping/ConversionMapLoader.h"
#include "TestFiles.h"

using namespace GeoBuffer;
using Mapping::Category;
using Mapping::ConversionMap;
using Mapping::ConversionMapLoader;

int main() {
    {
        // Later groups win for shared ids; the id keeps its first position.
        const auto path = GeoBufferTests::writeTemp(
            "map_groups.json",
            R"([{"ids": [1, 2], "to": [0, 0]}, {"ids": [3], "to": [5, 1]}, {"ids": [1], "to": [7, 2]}])");
        ConversionMap map;
        assert(ConversionMapLoader::loadGroups(path, map).ok());
        assert(map.size() == 3);
        assert((map.ids() == std::vector<int>{1, 2, 3}));
        assert(*map.category(1) == (Category{7, 2}));
        assert(*map.category(2) == (Category{0, 0}));
        assert(!map.category(99).has_value());
        std::filesystem::remove(path);
    }
    {
        // Ids and targets that do not fit in int are rejected instead of wrapping.
        const auto path = GeoBufferTests::writeTemp(
            "map_range.json",
            R"([{"ids": [4294967297, -4294967297, 18446744073709551615, 8], "to": [1, 2]},
                {"ids": [9], "to": [4294967296, 0]}])");
        ConversionMap map;
        assert(ConversionMapLoader::loadGroups(path, map).ok());
        assert((map.ids() == std::vector<int>{8}));
        assert(!map.contains(1));
        assert(!map.contains(9));
        std::filesystem::remove(path);
    }
    {
        // A list with no usable groups loads as an empty map.
        const auto path = GeoBufferTests::writeTemp("map_empty.json", "[]");
        ConversionMap map;
        map.assign(5, {1, 1});
        assert(ConversionMapLoader::loadGroups(path, map).ok());
        assert(map.empty());
        std::filesystem::remove(path);
    }
    {
        // Broken groups are skipped, the rest still load.
        const auto path = GeoBufferTests::writeTemp(
            "map_partial.json", R"([{"ids": [1], "to": [1]}, {"to": [2, 2]}, {"ids": [4, "x"], "to": [3, 0]}])");
        ConversionMap map;
        assert(ConversionMapLoader::loadGroups(path, map).ok());
        assert(map.size() == 1);
        assert(*map.category(4) == (Category{3, 0}));
        std::filesystem::remove(path);
    }
    {
        // No usable primary map is a configuration error.
        ConversionMap map;
        auto missing = ConversionMapLoader::loadGroups(GeoBufferTests::tempPath("nope.json").string(), map);
        assert(missing.code == Core::StatusCode::ConfigurationError);
        const auto path = GeoBufferTests::writeTemp("map_bad.json", "{ not json");
        auto bad = ConversionMapLoader::loadGroups(path, map);
        assert(bad.code == Core::StatusCode::ConfigurationError);
        std::filesystem::remove(path);
    }
    {
        // Roller selection moves all eight ids together; unknown names fall back to Default.
        ConversionMap map;
        map.assign(41, {1, 1});
        map.assign(100, {9, 9});
        assert(!map.hasRollerMappings());
        map.setRollerMappings({{"Default", {24, 4}}, {"Heavy", {30, 4}}});
        assert(map.hasRollerMappings());
        assert(map.applyRollerOverride("Heavy"));
        for (int id : Mapping::kRollerIds) {
            assert(*map.category(id) == (Category{30, 4}));
        }
        assert(map.size() == 9);
        assert(map.ids().front() == 41);
        assert(*map.category(100) == (Category{9, 9}));
        assert(map.applyRollerOverride("Unknown"));
        assert(*map.category(588) == (Category{24, 4}));
        // Idempotent.
        assert(map.applyRollerOverride("Unknown"));
        assert(map.size() == 9);
    }
    {
        // Without a Default entry the hardcoded category applies.
        ConversionMap map;
        map.setRollerMappings({{"Light", {12, 3}}});
        assert(map.applyRollerOverride("Missing"));
        assert(*map.category(42) == Mapping::kFallbackRollerCategory);
        assert((map.rollerNames() == std::vector<std::string>{"Light"}));
    }
    {
        // No roller configuration: rollers keep their group categories and nothing is added.
        ConversionMap map;
        map.assign(43, {2, 2});
        assert(!map.applyRollerOverride("Default"));
        assert(map.size() == 1);
        assert(*map.category(43) == (Category{2, 2}));
    }
    {
        // Roller file lookup: first parsable candidate wins, bad entries skipped, names trimmed.
        const auto broken = GeoBufferTests::writeTemp("rollers_broken.json", "[{");
        const auto good = GeoBufferTests::writeTemp(
            "rollers_good.json",
            R"([{"name": " Default ", "to": [24, 4]}, {"name": "", "to": [1, 1]}, {"name": "Odd", "to": 5},
                {"name": "Wide", "to": [40, 4]}])");
        auto rollers = ConversionMapLoader::loadRollerMappings(
            {GeoBufferTests::tempPath("missing_rollers.json").string(), broken, good});
        assert(rollers.has_value());
        assert(rollers->size() == 2);
        assert((*rollers)[0].name == "Default");
        assert(((*rollers)[1].to == Category{40, 4}));
        assert(!ConversionMapLoader::loadRollerMappings({GeoBufferTests::tempPath("missing_rollers.json").string()}));
        std::filesystem::remove(broken);
        std::filesystem::remove(good);
    }
    {
        // A roller file that is not a list counts as malformed.
        const auto path = GeoBufferTests::writeTemp("rollers_object.json", R"({"name": "Default", "to": [24, 4]})");
        assert(!ConversionMapLoader::loadRollerMappings({path}).has_value());
        std::filesystem::remove(path);
    }
    return 0;
}
