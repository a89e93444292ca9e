#pragma once

#include "projection/Layout.hpp"
#include "projection/Timestamp.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace rw::projection {

struct RegularFile {
    Timestamp boundary{};
};

struct Directory {};

// Symlinks, sockets, fifos, devices
struct Other {};

using EntryKind = std::variant<RegularFile, Directory, Other>;

/// lstat()s path and classifies it. A regular file carries the boundary read
/// from the requested inode time. Returns std::nullopt when path does not exist.
std::optional<EntryKind> classifyEntry(const std::filesystem::path& path, BoundarySource source);

/// Strips a trailing ".<digits>" version counter: "notes.txt.3" -> "notes.txt".
std::string decodeArchiveName(const std::string& filename);

/// True if filename is basename or basename.<digits>.
bool isArchiveVersionOf(const std::string& filename, const std::string& basename);

/// Sorted names of the children of dir; empty if dir does not exist or is not a directory.
std::vector<std::string> listEntryNames(const std::filesystem::path& dir);

}
