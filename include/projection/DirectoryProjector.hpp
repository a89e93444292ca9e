#pragma once

#include "projection/Layout.hpp"
#include "projection/Timestamp.hpp"

#include <string>
#include <vector>

namespace rw::projection {

/// Names present in relDir at timestamp: ".", "..", then the files, then the
/// directories and other non-file entries, each group sorted.
///
/// A file is listed when its live version or any archived version covers
/// timestamp, using the same boundary rules and snapping as resolveVersion().
/// Directories are listed whenever they exist in either tree, whatever the
/// timestamp. A name that is a file in one tree and a directory in the other
/// is listed twice.
///
/// Missing live or archive directories contribute nothing. Throws
/// Error(InvalidPath) for a malformed relDir; "" is the projection root.
std::vector<std::string> listDirectory(Timestamp timestamp, const std::string& relDir, const Layout& layout);

}
