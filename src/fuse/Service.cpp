#include "fuse/Service.hpp"
#include "fuse/Bridge.hpp"
#include "fuse/Operations.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>
#include <utility>

using namespace rw::logging;

namespace rw::fuse {

Service::Service(config::FuseConfig config, std::shared_ptr<Bridge> bridge, std::vector<std::string> fuseArgs)
    : config_(std::move(config)), bridge_(std::move(bridge)), fuseArgs_(std::move(fuseArgs)) {}

Service::~Service() {
    teardown();
}

void Service::run() {
    if (config_.mount_path.empty()) throw std::runtime_error("No mount point configured");

    bind(bridge_);

    std::vector<std::string> argStrings = {"rewind", "-o", "default_permissions", "-o", "fsname=rewind", "-o", "subtype=rewind"};
    if (config_.allow_other) {
        argStrings.emplace_back("-o");
        argStrings.emplace_back("allow_other");
    }
    argStrings.insert(argStrings.end(), fuseArgs_.begin(), fuseArgs_.end());

    std::vector<char*> argv;
    argv.reserve(argStrings.size());
    for (auto& arg : argStrings) argv.push_back(arg.data());

    fuse_args args = FUSE_ARGS_INIT(static_cast<int>(argv.size()), argv.data());
    const fuse_operations ops = getOperations();

    fuse_ = fuse_new(&args, &ops, sizeof(ops), nullptr);
    fuse_opt_free_args(&args);
    if (!fuse_) throw std::runtime_error("fuse_new failed (invalid FUSE options?)");

    if (fuse_mount(fuse_, config_.mount_path.c_str()) != 0) {
        teardown();
        throw std::runtime_error("fuse_mount failed for " + config_.mount_path.string());
    }
    mounted_ = true;

    LogRegistry::rewind()->info("[+] Projection of {} mounted at {}",
                                bridge_->layout().root.string(), config_.mount_path.string());

    if (fuse_daemonize(config_.foreground ? 1 : 0) != 0) {
        teardown();
        throw std::runtime_error("fuse_daemonize failed");
    }

    fuse_session* session = fuse_get_session(fuse_);
    if (fuse_set_signal_handlers(session) != 0) {
        teardown();
        throw std::runtime_error("fuse_set_signal_handlers failed");
    }

    int res;
    if (config_.single_threaded) {
        res = fuse_loop(fuse_);
    } else {
        fuse_loop_config loopConfig{};
        loopConfig.clone_fd = 0;
        loopConfig.max_idle_threads = config_.max_idle_threads;
        res = fuse_loop_mt(fuse_, &loopConfig);
    }

    fuse_remove_signal_handlers(session);

    if (res != 0) LogRegistry::rewind()->warn("[!] FUSE loop exited with status {}", res);

    teardown();
    LogRegistry::rewind()->info("[*] Unmounted {}", config_.mount_path.string());
}

void Service::teardown() {
    if (!fuse_) return;
    if (mounted_) fuse_unmount(fuse_);
    fuse_destroy(fuse_);
    fuse_ = nullptr;
    mounted_ = false;
}

}
