#pragma once

#include "projection/Layout.hpp"

#include <stdexcept>
#include <string>
#include <spdlog/spdlog.h>

namespace rw::config {

inline spdlog::level::level_enum parseLogLevel(const std::string& str) {
    const auto level = spdlog::level::from_str(str);
    // from_str() falls back to "off" for names it does not know
    if (level == spdlog::level::off && str != "off")
        throw std::invalid_argument("Invalid log level: " + str);
    return level;
}

inline std::string logLevelToString(const spdlog::level::level_enum level) {
    const auto sv = spdlog::level::to_string_view(level);
    return {sv.data(), sv.size()};
}

inline projection::BoundarySource parseBoundarySource(const std::string& str) {
    if (str == "mtime") return projection::BoundarySource::ModificationTime;
    if (str == "ctime") return projection::BoundarySource::StatusChangeTime;
    throw std::invalid_argument("Invalid live boundary source: " + str + " (expected mtime or ctime)");
}

inline std::string boundarySourceToString(const projection::BoundarySource source) {
    switch (source) {
        case projection::BoundarySource::ModificationTime: return "mtime";
        case projection::BoundarySource::StatusChangeTime: return "ctime";
    }
    return "unknown";
}

}
