// rewind: mount a read-only, time-indexed view of a synced directory tree.
//
//   rewind ~/sync/photos /mnt/rewind
//   ls /mnt/rewind/$(date --date="2015-12-25 8:00 PST" +%s)
//   less /mnt/rewind/$(date --date="2015-07-01" +%s)/file.txt

#define FUSE_USE_VERSION 35

#include "config/Config.hpp"
#include "config/ConfigRegistry.hpp"
#include "config/util.hpp"
#include "fuse/Bridge.hpp"
#include "fuse/Service.hpp"
#include "logging/LogRegistry.hpp"
#include "projection/Error.hpp"

#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fuse3/fuse.h>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace rw;
using namespace rw::config;
using namespace rw::logging;

namespace {

constexpr const char* VERSION = "0.1.0";

struct Options {
    const char* config = nullptr;
    int printConfig = 0;
    char* root = nullptr;
    char* mountpoint = nullptr;
};

enum { KEY_PRINT_CONFIG };

#define RW_OPTION(t, p) { t, offsetof(Options, p), 1 }

const fuse_opt optionSpec[] = {
    RW_OPTION("--config=%s", config),
    FUSE_OPT_KEY("--print-config", KEY_PRINT_CONFIG),
    FUSE_OPT_END
};

int optionProc(void* data, const char* arg, const int key, fuse_args* outargs) {
    (void)outargs;
    auto* opts = static_cast<Options*>(data);

    if (key == KEY_PRINT_CONFIG) {
        opts->printConfig = 1;
        return 0;
    }

    // <root> <mountpoint>; libfuse keeps everything else
    if (key == FUSE_OPT_KEY_NONOPT) {
        if (!opts->root) {
            opts->root = strdup(arg);
            return 0;
        }
        if (!opts->mountpoint) {
            opts->mountpoint = strdup(arg);
            return 0;
        }
    }

    return 1;
}

void printUsage(const char* progname) {
    std::cout << "usage: " << progname << " [options] <root> <mountpoint>\n\n"
              << "rewind options:\n"
              << "    --config=<file>        YAML config (default " << DEFAULT_CONFIG_PATH << " if present)\n"
              << "    --print-config         print the effective configuration and exit\n\n";
}

Config loadEffectiveConfig(const Options& opts, const fuse_cmdline_opts& cmd) {
    Config cfg;
    if (opts.config) cfg = loadConfig(opts.config);
    else if (std::filesystem::exists(DEFAULT_CONFIG_PATH)) cfg = loadConfig(DEFAULT_CONFIG_PATH);

    if (opts.root) cfg.projection.root_dir = opts.root;
    if (opts.mountpoint) cfg.fuse.mount_path = opts.mountpoint;
    cfg.makePathsAbsolute();

    if (cmd.foreground) cfg.fuse.foreground = true;
    if (cmd.singlethread) cfg.fuse.single_threaded = true;

    if (cmd.debug) {
        cfg.logging.levels.console_log_level = spdlog::level::debug;
        cfg.logging.levels.subsystem_levels.rewind = spdlog::level::debug;
        cfg.logging.levels.subsystem_levels.fuse = spdlog::level::debug;
    }

    return cfg;
}

}

int main(int argc, char* argv[]) {
    fuse_args args = FUSE_ARGS_INIT(argc, argv);
    Options opts;
    fuse_cmdline_opts cmd{};

    const auto cleanup = [&] {
        fuse_opt_free_args(&args);
        std::free(cmd.mountpoint);
        std::free(opts.root);
        std::free(opts.mountpoint);
        std::free(const_cast<char*>(opts.config));
    };

    if (fuse_opt_parse(&args, &opts, optionSpec, optionProc) != 0 || fuse_parse_cmdline(&args, &cmd) != 0) {
        cleanup();
        return EXIT_FAILURE;
    }

    if (cmd.show_help) {
        printUsage(argv[0]);
        fuse_cmdline_help();
        fuse_lib_help(&args);
        cleanup();
        return EXIT_SUCCESS;
    }

    if (cmd.show_version) {
        std::cout << "rewind version " << VERSION << "\nFUSE library version " << fuse_pkgversion() << std::endl;
        cleanup();
        return EXIT_SUCCESS;
    }

    try {
        ConfigRegistry::init(loadEffectiveConfig(opts, cmd));
        const auto& cfg = ConfigRegistry::get();

        if (opts.printConfig) {
            std::cout << cfg.dump() << std::endl;
            cleanup();
            return EXIT_SUCCESS;
        }

        LogRegistry::init(cfg.logging);

        if (cfg.projection.root_dir.empty() || cfg.fuse.mount_path.empty()) {
            printUsage(argv[0]);
            cleanup();
            return EXIT_FAILURE;
        }

        const auto layout = cfg.projection.layout();
        layout.ensureRoot();

        LogRegistry::rewind()->info("[*] Projecting {} (archive {}, live boundary from {})",
                                    layout.root.string(), layout.archiveDir.string(),
                                    boundarySourceToString(layout.liveBoundary));

        // what libfuse left over goes to fuse_new; the service supplies its own argv[0]
        std::vector<std::string> fuseArgs;
        for (int i = 1; i < args.argc; ++i) fuseArgs.emplace_back(args.argv[i]);

        const auto bridge = std::make_shared<fuse::Bridge>(layout, LogRegistry::fuse());
        fuse::Service service(cfg.fuse, bridge, std::move(fuseArgs));
        service.run();
    } catch (const projection::Error& e) {
        if (LogRegistry::isInitialized()) LogRegistry::rewind()->error("[-] {}", e.what());
        else std::cerr << "[-] " << e.what() << std::endl;
        cleanup();
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        if (LogRegistry::isInitialized()) LogRegistry::rewind()->error("[-] Failed to run rewind: {}", e.what());
        else std::cerr << "[-] Failed to run rewind: " << e.what() << std::endl;
        cleanup();
        return EXIT_FAILURE;
    }

    cleanup();
    return EXIT_SUCCESS;
}
