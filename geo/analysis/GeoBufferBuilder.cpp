#include "GeoBufferBuilder.h"

#include <algorithm>
#include <unordered_map>

namespace GeoBuffer::Analysis {

GeoBufferList buildGeoBufferList(const Mapping::ConversionMap& map, const MaxCountTable& maxCounts) {
    GeoBufferList entries;
    std::unordered_map<Mapping::Category, std::size_t, Mapping::CategoryHash> slotByCategory;

    for (int id : map.ids()) {
        auto countIt = maxCounts.find(id);
        const int count = countIt != maxCounts.end() ? countIt->second : 0;
        if (count <= 0) continue;

        const auto category = map.category(id);
        if (!category) continue;
        auto [it, inserted] = slotByCategory.emplace(*category, entries.size());
        if (inserted) {
            entries.push_back({category->x, category->y, 0});
        }
        entries[it->second].count += count;
    }

    std::stable_sort(entries.begin(), entries.end(),
                     [](const GeoBufferEntry& a, const GeoBufferEntry& b) { return a.x < b.x; });
    return entries;
}

}  // namespace GeoBuffer::Analysis
