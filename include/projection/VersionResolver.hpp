#pragma once

#include "projection/Layout.hpp"
#include "projection/Timestamp.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace rw::projection {

enum class Origin {
    Live,
    Archive
};

struct ResolvedVersion {
    /// Effective boundary after snapping: start of validity for a live file,
    /// end of validity for an archived one.
    Timestamp boundary{};
    std::filesystem::path path{};
    Origin origin{Origin::Live};

    bool operator==(const ResolvedVersion&) const = default;
};

/// Finds the physical file holding the content relPath had at timestamp.
///
/// The live file wins whenever timestamp >= its boundary. Otherwise the
/// archived versions (basename and basename.<digits> in the archive mirror of
/// relPath's directory) are ordered oldest first, the newest one takes the
/// live boundary if a live file exists, and the first version whose boundary
/// lies strictly after timestamp is returned.
///
/// Returns std::nullopt if no version covers timestamp. Throws Error with
/// InvalidPath for an empty or malformed relPath and ConfigurationError when
/// the layout root is missing or not a directory.
std::optional<ResolvedVersion> resolveVersion(Timestamp timestamp, const std::string& relPath, const Layout& layout);

}
