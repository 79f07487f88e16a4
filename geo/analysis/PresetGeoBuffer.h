// Fixed "GeoBuffer0" base loadout that can be prepended to every generated list.
#pragma once

#include "GeoBufferEntry.h"

namespace GeoBuffer::Analysis {

const GeoBufferList& presetGeoBuffer0();

// Returns preset + computed when enabled, computed unchanged otherwise. No merging.
GeoBufferList injectPreset(const GeoBufferList& computed, bool enabled);

}  // namespace GeoBuffer::Analysis
