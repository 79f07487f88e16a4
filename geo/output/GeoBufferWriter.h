// Writes geoBuffer entries as "x,y,z" lines.
#pragma once

#include <ostream>
#include <string>

#include "../../core/Status.h"
#include "../analysis/GeoBufferEntry.h"

namespace GeoBuffer::Output {

class GeoBufferWriter {
public:
    // Truncates any existing file at path.
    static Core::Status writeFile(const std::string& path, const Analysis::GeoBufferList& entries);
    static Core::Status writeStream(std::ostream& out, const Analysis::GeoBufferList& entries);
};

}  // namespace GeoBuffer::Output
