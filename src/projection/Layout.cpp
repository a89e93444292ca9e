#include "projection/Layout.hpp"
#include "projection/Error.hpp"

#include <cerrno>
#include <string_view>
#include <system_error>

namespace fs = std::filesystem;

namespace rw::projection {

fs::path Layout::livePath(const std::string& relPath) const {
    if (relPath.empty()) return root;
    return root / relPath;
}

fs::path Layout::archivePath(const std::string& relPath) const {
    const auto archiveRoot = root / archiveDir;
    if (relPath.empty()) return archiveRoot;
    return archiveRoot / relPath;
}

std::string Layout::metadataDirName() const {
    const auto rel = archiveDir.relative_path();
    if (rel.empty()) return {};
    return rel.begin()->string();
}

void Layout::ensureRoot() const {
    std::error_code ec;
    const auto status = fs::status(root, ec);

    if (status.type() == fs::file_type::not_found)
        throw Error(ErrorKind::ConfigurationError, ENOENT, "Projection root does not exist: " + root.string());

    if (ec) throw fs::filesystem_error("Failed to stat projection root", root, ec);

    if (!fs::is_directory(status))
        throw Error(ErrorKind::ConfigurationError, ENOTDIR, "Projection root is not a directory: " + root.string());
}

void validateRelPath(const std::string& relPath) {
    if (relPath.empty()) return;

    const auto invalid = [&relPath](const std::string& why) {
        return Error(ErrorKind::InvalidPath, EINVAL, "Invalid relative path '" + relPath + "': " + why);
    };

    if (relPath.front() == '/') throw invalid("leading separator");
    if (relPath.back() == '/') throw invalid("trailing separator");

    std::string_view rest = relPath;
    while (!rest.empty()) {
        const auto slash = rest.find('/');
        const auto segment = rest.substr(0, slash);
        if (segment.empty()) throw invalid("empty segment");
        if (segment == "." || segment == "..") throw invalid("dot segment");
        if (slash == std::string_view::npos) break;
        rest.remove_prefix(slash + 1);
    }
}

}
