#pragma once

#define FUSE_USE_VERSION 35

#include "projection/Layout.hpp"

#include <cerrno>
#include <fuse3/fuse.h>
#include <memory>
#include <spdlog/spdlog.h>

namespace rw::fuse {

/// Serves the read-only projection to libfuse. Paths are mount-relative
/// ("/<timestamp>/<relative path>"); every call returns 0, a byte count or a
/// negative errno and never throws.
class Bridge {
public:
    Bridge(projection::Layout layout, std::shared_ptr<spdlog::logger> log);

    int getattr(const char* path, struct stat* stbuf, fuse_file_info* fi) const;

    int readdir(const char* path, void* buf, fuse_fill_dir_t filler, off_t offset,
                fuse_file_info* fi, fuse_readdir_flags flags) const;

    int open(const char* path, fuse_file_info* fi) const;

    int read(const char* path, char* buf, size_t size, off_t offset, fuse_file_info* fi) const;

    int release(const char* path, fuse_file_info* fi) const;

    int flush(const char* path, fuse_file_info* fi) const;

    int fsync(const char* path, int isdatasync, fuse_file_info* fi) const;

    int access(const char* path, int mask) const;

    int statfs(const char* path, struct statvfs* stbuf) const;

    int readlink(const char* path, char* buf, size_t size) const;

    /// Every mutating operation ends here.
    int reject(const char* op, const char* path, int err = EROFS) const;

    [[nodiscard]] const projection::Layout& layout() const noexcept { return layout_; }

private:
    projection::Layout layout_;
    std::shared_ptr<spdlog::logger> log_;
};

}
