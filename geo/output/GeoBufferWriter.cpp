#include "GeoBufferWriter.h"

#include <fstream>

namespace GeoBuffer::Output {

Core::Status GeoBufferWriter::writeFile(const std::string& path, const Analysis::GeoBufferList& entries) {
    std::ofstream f(path, std::ios::out | std::ios::trunc);
    if (!f) {
        return Core::Status::ioError("error writing output file: cannot open " + path);
    }
    auto status = writeStream(f, entries);
    if (!status.ok()) {
        status.message += " (" + path + ")";
        return status;
    }
    f.close();
    if (f.fail()) {
        return Core::Status::ioError("error writing output file: flush failed for " + path);
    }
    return status;
}

Core::Status GeoBufferWriter::writeStream(std::ostream& out, const Analysis::GeoBufferList& entries) {
    for (const auto& e : entries) {
        out << e.x << ',' << e.y << ',' << e.count << '\n';
    }
    if (!out.good()) {
        return Core::Status::ioError("error writing output file");
    }
    return Core::Status::success();
}

}  // namespace GeoBuffer::Output
