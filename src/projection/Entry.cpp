#include "projection/Entry.hpp"

#include <algorithm>
#include <cerrno>
#include <regex>
#include <system_error>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace rw::projection {

std::optional<EntryKind> classifyEntry(const fs::path& path, const BoundarySource source) {
    struct stat st{};
    if (::lstat(path.c_str(), &st) != 0) {
        const int err = errno;
        if (err == ENOENT || err == ENOTDIR) return std::nullopt;
        throw fs::filesystem_error("lstat failed", path, std::error_code(err, std::generic_category()));
    }

    if (S_ISREG(st.st_mode)) {
        const auto seconds = source == BoundarySource::StatusChangeTime ? st.st_ctim.tv_sec : st.st_mtim.tv_sec;
        return RegularFile{static_cast<Timestamp>(seconds)};
    }

    if (S_ISDIR(st.st_mode)) return Directory{};
    return Other{};
}

std::string decodeArchiveName(const std::string& filename) {
    static const std::regex versionSuffix(R"(\.[0-9]+$)");
    return std::regex_replace(filename, versionSuffix, "");
}

bool isArchiveVersionOf(const std::string& filename, const std::string& basename) {
    return filename == basename || decodeArchiveName(filename) == basename;
}

std::vector<std::string> listEntryNames(const fs::path& dir) {
    std::error_code ec;
    const auto status = fs::status(dir, ec);
    if (status.type() == fs::file_type::not_found) return {};
    if (ec) throw fs::filesystem_error("Failed to stat directory", dir, ec);
    if (!fs::is_directory(status)) return {};

    std::vector<std::string> names;
    for (const auto& entry : fs::directory_iterator(dir)) names.push_back(entry.path().filename().string());

    std::ranges::sort(names);
    return names;
}

}
