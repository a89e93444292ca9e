#pragma once

#include "config/Config.hpp"
#include "config/util.hpp"

#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace rw::config;

template<>
struct convert<ProjectionConfig> {
    static Node encode(const ProjectionConfig& rhs) {
        Node node;
        node["root_dir"] = rhs.root_dir.string();
        node["archive_dir"] = rhs.archive_dir.string();
        node["live_boundary"] = boundarySourceToString(rhs.live_boundary);
        return node;
    }

    static bool decode(const Node& node, ProjectionConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.root_dir = node["root_dir"].as<std::string>(rhs.root_dir.string());
        rhs.archive_dir = node["archive_dir"].as<std::string>(rhs.archive_dir.string());
        rhs.live_boundary = parseBoundarySource(node["live_boundary"].as<std::string>("mtime"));
        return true;
    }
};

template<>
struct convert<FuseConfig> {
    static Node encode(const FuseConfig& rhs) {
        Node node;
        node["mount_path"] = rhs.mount_path.string();
        node["foreground"] = rhs.foreground;
        node["single_threaded"] = rhs.single_threaded;
        node["allow_other"] = rhs.allow_other;
        node["max_idle_threads"] = rhs.max_idle_threads;
        return node;
    }

    static bool decode(const Node& node, FuseConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.mount_path = node["mount_path"].as<std::string>(rhs.mount_path.string());
        rhs.foreground = node["foreground"].as<bool>(true);
        rhs.single_threaded = node["single_threaded"].as<bool>(true);
        rhs.allow_other = node["allow_other"].as<bool>(false);
        rhs.max_idle_threads = node["max_idle_threads"].as<unsigned int>(10);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["rewind"] = logLevelToString(rhs.rewind);
        node["fuse"]   = logLevelToString(rhs.fuse);
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.rewind = parseLogLevel(node["rewind"].as<std::string>("info"));
        rhs.fuse = parseLogLevel(node["fuse"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = logLevelToString(rhs.console_log_level);
        node["file_log_level"]    = logLevelToString(rhs.file_log_level);
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = parseLogLevel(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = parseLogLevel(node["file_log_level"].as<std::string>("warn"));
        if (const auto sub = node["subsystem_levels"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>(rhs.log_dir.string());
        if (const auto levels = node["levels"]) rhs.levels = levels.as<LogLevelsConfig>();
        return true;
    }
};

}
