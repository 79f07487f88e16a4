// Window scan, category fold and preset injection.
#include <algorithm>
#include <cassert>

#include "../geo/analysis/GeoBufferBuilder.h"
#include "../geo/analysis/PresetGeoBuffer.h"
#include "../geo/analysis/WindowAnalyzer.h"

using namespace GeoBuffer;
using Analysis::GeoBufferEntry;
using Analysis::GeoBufferList;
using Analysis::MaxCountTable;
using Analysis::WindowAnalyzer;
using Level::LevelGrid;
using Level::Row;

int main() {
    {
        // Three rows, window 2: both windows hold five of each id.
        LevelGrid grid{Row{1, 1, 1, 1, 1}, Row{2, 2, 2, 2, 2}, Row{1, 1, 1, 1, 1}};
        Mapping::ConversionMap map;
        map.assign(1, {0, 0});
        map.assign(2, {1, 0});
        MaxCountTable counts;
        assert(WindowAnalyzer::analyze(grid, 2, map, counts).ok());
        assert(counts.at(1) == 5);
        assert(counts.at(2) == 5);
        auto list = Analysis::buildGeoBufferList(map, counts);
        assert((list == GeoBufferList{{0, 0, 5}, {1, 0, 5}}));
    }
    {
        // The best window is found even when it is not the first one.
        LevelGrid grid{Row{0, 0, 0, 0, 0}, Row{0, 0, 0, 0, 0}, Row{3, 3, 0, 0, 0}, Row{3, 3, 3, 0, 0},
                       Row{0, 0, 0, 0, 3}};
        Mapping::ConversionMap map;
        map.assign(3, {4, 1});
        MaxCountTable counts;
        assert(WindowAnalyzer::analyze(grid, 2, map, counts).ok());
        assert(counts.at(3) == 5);
        assert(WindowAnalyzer::analyze(grid, 1, map, counts).ok());
        assert(counts.at(3) == 3);
    }
    {
        // Window equal to the grid counts everything once; a longer window sees nothing.
        LevelGrid grid{Row{5, 6, 5, 0, 0}, Row{6, 6, 9, 9, 9}};
        Mapping::ConversionMap map;
        map.assign(5, {0, 0});
        map.assign(6, {1, 0});
        map.assign(7, {2, 4});
        MaxCountTable counts;
        assert(WindowAnalyzer::analyze(grid, 2, map, counts).ok());
        assert(counts.size() == 3);
        assert(counts.at(5) == 2);
        assert(counts.at(6) == 3);
        assert(counts.at(7) == 0);
        assert(counts.count(9) == 0);
        auto list = Analysis::buildGeoBufferList(map, counts);
        assert(list.size() == 2);  // (2,4) omitted, id 7 never appears

        assert(WindowAnalyzer::analyze(grid, 3, map, counts).ok());
        assert(counts.size() == 3);
        for (const auto& [id, count] : counts) assert(count == 0);
        assert(Analysis::buildGeoBufferList(map, counts).empty());
    }
    {
        // Non-positive window sizes are rejected before scanning.
        LevelGrid grid{Row{1, 1, 1, 1, 1}};
        Mapping::ConversionMap map;
        map.assign(1, {0, 0});
        MaxCountTable counts;
        assert(WindowAnalyzer::analyze(grid, 0, map, counts).code == Core::StatusCode::ConfigurationError);
        assert(WindowAnalyzer::analyze(grid, -4, map, counts).code == Core::StatusCode::ConfigurationError);
    }
    {
        int size = 0;
        assert(WindowAnalyzer::parseWindowSize(" 200 ", size).ok());
        assert(size == 200);
        assert(WindowAnalyzer::parseWindowSize("12abc", size).code == Core::StatusCode::ConfigurationError);
        assert(WindowAnalyzer::parseWindowSize("1.5", size).code == Core::StatusCode::ConfigurationError);
        assert(WindowAnalyzer::parseWindowSize("", size).code == Core::StatusCode::ConfigurationError);
        assert(WindowAnalyzer::parseWindowSize("0", size).code == Core::StatusCode::ConfigurationError);
        assert(size == 200);
    }
    {
        // Ids sharing a category sum; equal x keeps fold order rather than ordering by y.
        Mapping::ConversionMap map;
        map.assign(10, {3, 9});
        map.assign(11, {1, 0});
        map.assign(12, {3, 2});
        map.assign(13, {3, 9});
        map.assign(14, {0, 5});
        MaxCountTable counts{{10, 4}, {11, 1}, {12, 2}, {13, 6}, {14, 0}};
        auto list = Analysis::buildGeoBufferList(map, counts);
        assert((list == GeoBufferList{{1, 0, 1}, {3, 9, 10}, {3, 2, 2}}));
    }
    {
        // Negative category coordinates fold and hash like any other key.
        Mapping::ConversionMap map;
        map.assign(1, {-3, 0});
        map.assign(2, {-3, 0});
        map.assign(3, {-3, -1});
        map.assign(4, {0, -3});
        MaxCountTable counts{{1, 2}, {2, 4}, {3, 1}, {4, 5}};
        auto list = Analysis::buildGeoBufferList(map, counts);
        assert((list == GeoBufferList{{-3, 0, 6}, {-3, -1, 1}, {0, -3, 5}}));
        Mapping::CategoryHash hash;
        assert(hash({-3, 0}) != hash({-3, -1}));
        assert(hash({-3, 0}) == hash({-3, 0}));
    }
    {
        // Sum does not depend on which colliding id is folded first.
        Mapping::ConversionMap a;
        a.assign(1, {2, 2});
        a.assign(2, {2, 2});
        Mapping::ConversionMap b;
        b.assign(2, {2, 2});
        b.assign(1, {2, 2});
        MaxCountTable counts{{1, 7}, {2, 5}};
        assert(Analysis::buildGeoBufferList(a, counts) == Analysis::buildGeoBufferList(b, counts));
        assert(Analysis::buildGeoBufferList(a, counts).front().count == 12);
    }
    {
        // Preset goes first, untouched and unsorted against the computed entries.
        const auto& preset = Analysis::presetGeoBuffer0();
        assert(preset.size() == 59);
        assert((preset.front() == GeoBufferEntry{0, 0, 100}));
        assert((preset.back() == GeoBufferEntry{364, 10, 1}));
        GeoBufferList computed{{5, 0, 3}};
        auto out = Analysis::injectPreset(computed, true);
        assert(out.size() == preset.size() + 1);
        assert(std::equal(preset.begin(), preset.end(), out.begin()));
        assert((out.back() == GeoBufferEntry{5, 0, 3}));
        assert(Analysis::injectPreset(computed, false) == computed);
        assert(Analysis::injectPreset({}, true) == preset);
    }
    return 0;
}
