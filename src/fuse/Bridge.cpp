#include "fuse/Bridge.hpp"
#include "projection/DirectoryProjector.hpp"
#include "projection/Error.hpp"
#include "projection/VersionResolver.hpp"
#include "projection/VirtualPath.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <unistd.h>
#include <utility>

namespace fs = std::filesystem;
using namespace rw::projection;

namespace rw::fuse {

namespace {

constexpr int WRITE_FLAGS = O_WRONLY | O_RDWR | O_APPEND | O_CREAT | O_TRUNC;
constexpr mode_t WRITE_BITS = S_IWUSR | S_IWGRP | S_IWOTH;

template <typename Fn>
int guarded(spdlog::logger& log, const char* op, const char* path, Fn&& fn) {
    try {
        return fn();
    } catch (const Error& e) {
        log.warn("[{}] {} ({}): {}", op, path, to_string(e.kind()), e.what());
        return -e.errnum();
    } catch (const fs::filesystem_error& e) {
        log.error("[{}] Filesystem error for {}: {}", op, path, e.what());
        return e.code().value() > 0 ? -e.code().value() : -EIO;
    } catch (const std::exception& e) {
        log.error("[{}] Exception for {}: {}", op, path, e.what());
        return -EIO;
    }
}

int statReadOnly(const fs::path& physical, struct stat* stbuf) {
    if (::lstat(physical.c_str(), stbuf) != 0) return -errno;
    stbuf->st_mode &= ~WRITE_BITS;
    return 0;
}

int fill(void* buf, const fuse_fill_dir_t filler, const char* name) {
    return filler(buf, name, nullptr, 0, static_cast<fuse_fill_dir_flags>(0));
}

}

Bridge::Bridge(Layout layout, std::shared_ptr<spdlog::logger> log)
    : layout_(std::move(layout)), log_(std::move(log)) {}

int Bridge::getattr(const char* path, struct stat* stbuf, fuse_file_info* fi) const {
    (void)fi;
    log_->debug("[getattr] Called for path: {}", path);

    return guarded(*log_, "getattr", path, [&] {
        std::memset(stbuf, 0, sizeof(struct stat));

        if (std::strcmp(path, "/") == 0) return statReadOnly(layout_.root, stbuf);

        const auto vpath = parseVirtualPath(path);
        if (!vpath) return -ENOENT;

        if (vpath->isTimestampRoot()) return statReadOnly(layout_.root, stbuf);

        if (const auto version = resolveVersion(vpath->timestamp, vpath->relPath, layout_))
            return statReadOnly(version->path, stbuf);

        // Directories are taken to exist at every instant once they exist in either tree.
        for (const auto& dir : {layout_.livePath(vpath->relPath), layout_.archivePath(vpath->relPath)}) {
            std::error_code ec;
            if (fs::is_directory(dir, ec)) return statReadOnly(dir, stbuf);
        }

        return -ENOENT;
    });
}

int Bridge::readdir(const char* path, void* buf, const fuse_fill_dir_t filler, const off_t offset,
                    fuse_file_info* fi, const fuse_readdir_flags flags) const {
    (void)offset;
    (void)fi;
    (void)flags;
    log_->debug("[readdir] Called for path: {}", path);

    return guarded(*log_, "readdir", path, [&] {
        // Instants are not enumerable; the mount root only holds the self/parent entries.
        if (std::strcmp(path, "/") == 0) {
            fill(buf, filler, ".");
            fill(buf, filler, "..");
            return 0;
        }

        const auto vpath = parseVirtualPath(path);
        if (!vpath) return -ENOENT;

        for (const auto& name : listDirectory(vpath->timestamp, vpath->relPath, layout_)) {
            // an archived ".5" decodes to ""; the kernel fails the whole readdir on a zero-length name
            if (name.empty()) continue;
            if (fill(buf, filler, name.c_str()) != 0) break;
        }

        return 0;
    });
}

int Bridge::open(const char* path, fuse_file_info* fi) const {
    log_->debug("[open] Called for path: {}, flags: {:#o}", path, fi->flags);

    if ((fi->flags & WRITE_FLAGS) != 0) {
        log_->warn("[open] Rejected write access to {}", path);
        return -EROFS;
    }

    return guarded(*log_, "open", path, [&] {
        const auto vpath = parseVirtualPath(path);
        if (!vpath) return -ENOENT;
        if (vpath->isTimestampRoot()) return -EISDIR;

        const auto version = resolveVersion(vpath->timestamp, vpath->relPath, layout_);
        if (!version) return -ENOENT;

        const int fd = ::open(version->path.c_str(), O_RDONLY);
        if (fd < 0) {
            const int err = errno;
            log_->error("[open] Failed to open {}: {}", version->path.string(), std::strerror(err));
            return -err;
        }

        fi->fh = static_cast<uint64_t>(fd);
        log_->debug("[open] {} -> {} ({}, boundary {})", path, version->path.string(),
                    version->origin == Origin::Live ? "live" : "archive", version->boundary);
        return 0;
    });
}

int Bridge::read(const char* path, char* buf, const size_t size, const off_t offset, fuse_file_info* fi) const {
    const ssize_t n = ::pread(static_cast<int>(fi->fh), buf, size, offset);
    if (n < 0) {
        const int err = errno;
        log_->error("[read] Failed to read {} at offset {}: {}", path, offset, std::strerror(err));
        return -err;
    }
    return static_cast<int>(n);
}

int Bridge::release(const char* path, fuse_file_info* fi) const {
    if (::close(static_cast<int>(fi->fh)) != 0) {
        const int err = errno;
        log_->error("[release] Failed to close handle for {}: {}", path, std::strerror(err));
        return -err;
    }
    return 0;
}

int Bridge::flush(const char* path, fuse_file_info* fi) const {
    (void)path;
    (void)fi;
    return 0;
}

int Bridge::fsync(const char* path, const int isdatasync, fuse_file_info* fi) const {
    (void)path;
    (void)isdatasync;
    (void)fi;
    return 0;
}

int Bridge::access(const char* path, const int mask) const {
    if ((mask & W_OK) != 0) {
        log_->debug("[access] Write access denied for {}", path);
        return -EROFS;
    }
    return 0;
}

int Bridge::statfs(const char* path, struct statvfs* stbuf) const {
    if (::statvfs(layout_.root.c_str(), stbuf) != 0) {
        const int err = errno;
        log_->error("[statfs] Failed to get filesystem stats for {}: {}", path, std::strerror(err));
        return -err;
    }
    stbuf->f_flag |= ST_RDONLY;
    return 0;
}

int Bridge::readlink(const char* path, char* buf, const size_t size) const {
    (void)buf;
    (void)size;
    return reject("readlink", path, EACCES);
}

int Bridge::reject(const char* op, const char* path, const int err) const {
    log_->warn("[{}] Rejected on read-only projection: {}", op, path);
    return -err;
}

}
