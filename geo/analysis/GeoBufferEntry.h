// One line of geoBuffer output: category x, category y, summed count.
#pragma once

#include <vector>

namespace GeoBuffer::Analysis {

struct GeoBufferEntry {
    int x{0};
    int y{0};
    int count{0};

    bool operator==(const GeoBufferEntry& other) const {
        return x == other.x && y == other.y && count == other.count;
    }
    bool operator!=(const GeoBufferEntry& other) const { return !(*this == other); }
};

using GeoBufferList = std::vector<GeoBufferEntry>;

}  // namespace GeoBuffer::Analysis
