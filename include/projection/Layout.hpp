#pragma once

#include <filesystem>
#include <string>

namespace rw::projection {

/// Which inode time marks the moment a live file's content was created.
/// Archived versions always use the modification time: a path that changed
/// type gets a status-change time newer than its content.
enum class BoundarySource {
    ModificationTime,
    StatusChangeTime
};

/// On-disk conventions of one projection: the live tree and the archive tree
/// the sync tool mirrors below it.
struct Layout {
    std::filesystem::path root{};
    std::filesystem::path archiveDir{".sync/Archive"};  // relative to root
    BoundarySource liveBoundary{BoundarySource::ModificationTime};

    [[nodiscard]] std::filesystem::path livePath(const std::string& relPath) const;
    [[nodiscard]] std::filesystem::path archivePath(const std::string& relPath) const;

    /// Top-level directory holding the sync tool's metadata, hidden from root listings.
    [[nodiscard]] std::string metadataDirName() const;

    /// Throws Error(ConfigurationError) unless root exists and is a directory.
    void ensureRoot() const;
};

/// Throws Error(InvalidPath) if relPath has a leading or trailing separator,
/// an empty segment, or a "." or ".." segment. The empty string is accepted.
void validateRelPath(const std::string& relPath);

}
