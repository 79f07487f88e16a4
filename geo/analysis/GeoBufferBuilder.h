// Folds per-id maxima into per-category geoBuffer entries.
#pragma once

#include "../mapping/ConversionMap.h"
#include "GeoBufferEntry.h"
#include "WindowAnalyzer.h"

namespace GeoBuffer::Analysis {

// Ids sharing a category have their counts summed; ids with a zero count are left out.
// Entries come back sorted by x only, keeping the fold order for equal x.
GeoBufferList buildGeoBufferList(const Mapping::ConversionMap& map, const MaxCountTable& maxCounts);

}  // namespace GeoBuffer::Analysis
