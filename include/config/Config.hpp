#pragma once

#include "projection/Layout.hpp"

#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace rw::config {

inline constexpr const char* DEFAULT_CONFIG_PATH = "/etc/rewind/config.yaml";

struct ProjectionConfig {
    std::filesystem::path root_dir{};
    std::filesystem::path archive_dir{".sync/Archive"};
    projection::BoundarySource live_boundary = projection::BoundarySource::ModificationTime;

    [[nodiscard]] projection::Layout layout() const;
};

struct FuseConfig {
    std::filesystem::path mount_path{};
    bool foreground = true;
    bool single_threaded = true;
    bool allow_other = false;
    unsigned int max_idle_threads = 10;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum rewind = spdlog::level::info;  // mount/unmount, startup failures
    spdlog::level::level_enum fuse   = spdlog::level::warn;  // rejected writes, I/O failures; debug traces every op
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir{};  // empty: console only
    LogLevelsConfig levels;
};

struct Config {
    ProjectionConfig projection;
    FuseConfig fuse;
    LoggingConfig logging;

    /// Effective configuration rendered as YAML, in the layout loadConfig() reads.
    [[nodiscard]] std::string dump() const;

    /// Anchors relative root_dir, mount_path and log_dir at the current directory.
    /// Must run before fuse_daemonize() switches to "/".
    void makePathsAbsolute();
};

/// Reads a YAML config file. Sections and keys that are absent keep their defaults.
Config loadConfig(const std::filesystem::path& path);

}
