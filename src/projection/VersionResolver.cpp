#include "projection/VersionResolver.hpp"
#include "projection/Entry.hpp"
#include "projection/Error.hpp"

#include <algorithm>
#include <cerrno>
#include <vector>

namespace fs = std::filesystem;

namespace rw::projection {

std::optional<ResolvedVersion> resolveVersion(const Timestamp timestamp, const std::string& relPath, const Layout& layout) {
    if (relPath.empty()) throw Error(ErrorKind::InvalidPath, EINVAL, "Relative path must not be empty");
    validateRelPath(relPath);
    layout.ensureRoot();

    const auto livePath = layout.livePath(relPath);
    std::optional<Timestamp> liveBoundary;

    if (const auto kind = classifyEntry(livePath, layout.liveBoundary)) {
        if (const auto* file = std::get_if<RegularFile>(&*kind)) {
            liveBoundary = file->boundary;
            if (timestamp >= file->boundary) return ResolvedVersion{file->boundary, livePath, Origin::Live};
        }
    }

    const fs::path rel(relPath);
    const auto archiveDir = layout.archivePath(rel.parent_path().string());
    const auto basename = rel.filename().string();

    std::vector<ResolvedVersion> versions;
    for (const auto& name : listEntryNames(archiveDir)) {
        if (!isArchiveVersionOf(name, basename)) continue;

        auto path = archiveDir / name;
        const auto kind = classifyEntry(path, BoundarySource::ModificationTime);
        if (!kind) continue;

        if (const auto* file = std::get_if<RegularFile>(&*kind))
            versions.push_back({file->boundary, std::move(path), Origin::Archive});
    }

    // oldest first; names are pre-sorted so equal boundaries keep a stable order
    std::ranges::stable_sort(versions, {}, &ResolvedVersion::boundary);

    if (liveBoundary && !versions.empty()) versions.back().boundary = *liveBoundary;

    for (const auto& version : versions)
        if (timestamp < version.boundary) return version;

    return std::nullopt;
}

}
