#pragma once

#define FUSE_USE_VERSION 35

#include "config/Config.hpp"

#include <filesystem>
#include <fuse3/fuse.h>
#include <memory>
#include <string>
#include <vector>

namespace rw::fuse {

class Bridge;

/// Mounts a Bridge and runs the libfuse event loop until the filesystem is
/// unmounted or the process receives SIGINT/SIGTERM/SIGHUP.
class Service {
public:
    /// fuseArgs are extra libfuse library options (e.g. "-o", "allow_other", "-d").
    Service(config::FuseConfig config, std::shared_ptr<Bridge> bridge, std::vector<std::string> fuseArgs = {});
    ~Service();

    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;

    /// Blocks. Throws std::runtime_error if the filesystem cannot be created or mounted.
    void run();

    [[nodiscard]] const std::filesystem::path& mountPoint() const noexcept { return config_.mount_path; }

private:
    config::FuseConfig config_;
    std::shared_ptr<Bridge> bridge_;
    std::vector<std::string> fuseArgs_;

    struct fuse* fuse_{nullptr};
    bool mounted_ = false;

    void teardown();
};

}
