#include "projection/DirectoryProjector.hpp"
#include "projection/Entry.hpp"

#include <algorithm>
#include <functional>
#include <optional>
#include <set>
#include <unordered_map>

namespace rw::projection {

using LiveBoundaries = std::unordered_map<std::string, Timestamp>;

static std::optional<Timestamp> liveBoundaryOf(const LiveBoundaries& boundaries, const std::string& name) {
    const auto it = boundaries.find(name);
    if (it == boundaries.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> listDirectory(const Timestamp timestamp, const std::string& relDir, const Layout& layout) {
    validateRelPath(relDir);

    std::set<std::string> files, dirs;
    LiveBoundaries liveBoundaries;

    const auto liveDir = layout.livePath(relDir);
    const auto metadataDir = relDir.empty() ? layout.metadataDirName() : std::string{};

    for (const auto& name : listEntryNames(liveDir)) {
        const auto kind = classifyEntry(liveDir / name, layout.liveBoundary);
        if (!kind) continue;

        if (const auto* file = std::get_if<RegularFile>(&*kind)) {
            liveBoundaries.emplace(name, file->boundary);
            if (timestamp >= file->boundary) files.insert(name);
        } else if (metadataDir.empty() || name != metadataDir) {
            dirs.insert(name);
        }
    }

    // logical name -> boundaries of its archived versions
    std::unordered_map<std::string, std::vector<Timestamp>> archived;
    const auto archiveDir = layout.archivePath(relDir);

    for (const auto& name : listEntryNames(archiveDir)) {
        const auto kind = classifyEntry(archiveDir / name, BoundarySource::ModificationTime);
        if (!kind) continue;

        if (const auto* file = std::get_if<RegularFile>(&*kind)) archived[decodeArchiveName(name)].push_back(file->boundary);
        else dirs.insert(name);
    }

    for (auto& [logicalName, boundaries] : archived) {
        std::ranges::sort(boundaries, std::greater<>{});

        if (const auto live = liveBoundaryOf(liveBoundaries, logicalName)) boundaries.front() = *live;

        if (std::ranges::any_of(boundaries, [timestamp](const Timestamp b) { return b > timestamp; }))
            files.insert(logicalName);
    }

    std::vector<std::string> listing{".", ".."};
    listing.reserve(2 + files.size() + dirs.size());
    listing.insert(listing.end(), files.begin(), files.end());
    listing.insert(listing.end(), dirs.begin(), dirs.end());
    return listing;
}

}
