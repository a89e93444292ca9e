#pragma once

#include "projection/Timestamp.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace rw::projection {

/// A path below the mount point, split into the instant to view and the
/// path relative to the projection root ("" denotes the root itself).
struct VirtualPath {
    Timestamp timestamp{};
    std::string relPath{};

    [[nodiscard]] bool isTimestampRoot() const noexcept { return relPath.empty(); }

    bool operator==(const VirtualPath&) const = default;
};

/// Parses "/<timestamp>" or "/<timestamp>/<relative path>".
///
/// The timestamp may be written as an integer or a decimal number and is
/// truncated toward zero; it must not be negative. A trailing separator, a
/// missing leading separator or an empty segment right after the timestamp
/// makes the path invalid. The relative path itself is not inspected.
///
/// e.g. parseVirtualPath("/2000.20/dir/file.txt") == VirtualPath{2000, "dir/file.txt"}
std::optional<VirtualPath> parseVirtualPath(std::string_view path);

std::optional<Timestamp> parseTimestampToken(std::string_view token);

}
