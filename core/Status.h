// Outcome of a pipeline step: a code the caller can branch on plus a readable message.
#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace GeoBuffer::Core {

enum class StatusCode {
    Ok,
    IOError,             // file open/read/write failure
    ConfigurationError,  // bad window size, unusable mapping config, missing paths
    EmptyResult,         // nothing to analyze or nothing to write
    MalformedData        // rejected data line (strict parsing only)
};

struct Status {
    StatusCode code{StatusCode::Ok};
    std::string message;

    bool ok() const { return code == StatusCode::Ok; }

    static Status success() { return {}; }
    static Status ioError(std::string msg) { return {StatusCode::IOError, std::move(msg)}; }
    static Status configError(std::string msg) { return {StatusCode::ConfigurationError, std::move(msg)}; }
    static Status empty(std::string msg) { return {StatusCode::EmptyResult, std::move(msg)}; }
    static Status malformed(std::string msg) { return {StatusCode::MalformedData, std::move(msg)}; }
};

inline std::string_view toString(StatusCode code) {
    switch (code) {
        case StatusCode::Ok:
            return "ok";
        case StatusCode::IOError:
            return "io error";
        case StatusCode::ConfigurationError:
            return "configuration error";
        case StatusCode::EmptyResult:
            return "empty result";
        case StatusCode::MalformedData:
        default:
            return "malformed data";
    }
}

}  // namespace GeoBuffer::Core
