#include "fuse/Operations.hpp"
#include "fuse/Bridge.hpp"

#include <cerrno>
#include <utility>

namespace rw::fuse {

static std::shared_ptr<Bridge> bridge = nullptr;

void bind(std::shared_ptr<Bridge> b) {
    bridge = std::move(b);
}

static int getattr(const char* path, struct stat* stbuf, fuse_file_info* fi) {
    if (!bridge) return -EIO;
    return bridge->getattr(path, stbuf, fi);
}

static int readdir(const char* path, void* buf, const fuse_fill_dir_t filler, const off_t offset,
                   fuse_file_info* fi, const fuse_readdir_flags flags) {
    if (!bridge) return -EIO;
    return bridge->readdir(path, buf, filler, offset, fi, flags);
}

static int open(const char* path, fuse_file_info* fi) {
    if (!bridge) return -EIO;
    return bridge->open(path, fi);
}

static int read(const char* path, char* buf, const size_t size, const off_t offset, fuse_file_info* fi) {
    if (!bridge) return -EIO;
    return bridge->read(path, buf, size, offset, fi);
}

static int release(const char* path, fuse_file_info* fi) {
    if (!bridge) return -EIO;
    return bridge->release(path, fi);
}

static int flush(const char* path, fuse_file_info* fi) {
    if (!bridge) return -EIO;
    return bridge->flush(path, fi);
}

static int fsync(const char* path, const int isdatasync, fuse_file_info* fi) {
    if (!bridge) return -EIO;
    return bridge->fsync(path, isdatasync, fi);
}

static int access(const char* path, const int mask) {
    if (!bridge) return -EIO;
    return bridge->access(path, mask);
}

static int statfs(const char* path, struct statvfs* stbuf) {
    if (!bridge) return -EIO;
    return bridge->statfs(path, stbuf);
}

static int readlink(const char* path, char* buf, const size_t size) {
    if (!bridge) return -EIO;
    return bridge->readlink(path, buf, size);
}

// --- rejected: the projection is read-only ---

static int reject(const char* op, const char* path, const int err = EROFS) {
    if (!bridge) return -EIO;
    return bridge->reject(op, path, err);
}

static int write(const char* path, const char*, size_t, off_t, fuse_file_info*) { return reject("write", path); }
static int create(const char* path, mode_t, fuse_file_info*) { return reject("create", path); }
static int truncate(const char* path, off_t, fuse_file_info*) { return reject("truncate", path); }
static int mknod(const char* path, mode_t, dev_t) { return reject("mknod", path); }
static int mkdir(const char* path, mode_t) { return reject("mkdir", path); }
static int rmdir(const char* path) { return reject("rmdir", path); }
static int unlink(const char* path) { return reject("unlink", path); }
static int rename(const char* from, const char*, unsigned int) { return reject("rename", from); }
static int symlink(const char*, const char* linkpath) { return reject("symlink", linkpath); }
static int link(const char*, const char* newpath) { return reject("link", newpath); }
static int chmod(const char* path, mode_t, fuse_file_info*) { return reject("chmod", path); }
static int chown(const char* path, uid_t, gid_t, fuse_file_info*) { return reject("chown", path); }
static int utimens(const char* path, const timespec[2], fuse_file_info*) { return reject("utimens", path, EACCES); }

fuse_operations getOperations() {
    fuse_operations ops = {};
    ops.getattr = getattr;
    ops.readlink = readlink;
    ops.mknod = mknod;
    ops.mkdir = mkdir;
    ops.unlink = unlink;
    ops.rmdir = rmdir;
    ops.symlink = symlink;
    ops.rename = rename;
    ops.link = link;
    ops.chmod = chmod;
    ops.chown = chown;
    ops.truncate = truncate;
    ops.open = open;
    ops.read = read;
    ops.write = write;
    ops.statfs = statfs;
    ops.flush = flush;
    ops.release = release;
    ops.fsync = fsync;
    ops.readdir = readdir;
    ops.access = access;
    ops.create = create;
    ops.utimens = utimens;
    return ops;
}

}
