#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace rw::config {

template <typename T>
static void decodeSection(const YAML::Node& root, const std::string& key, T& section, const std::filesystem::path& path) {
    const auto node = root[key];
    if (!node) return;
    if (!YAML::convert<T>::decode(node, section))
        throw std::runtime_error("Invalid '" + key + "' section in config file: " + path.string());
}

projection::Layout ProjectionConfig::layout() const {
    projection::Layout layout;
    layout.root = root_dir;
    layout.archiveDir = archive_dir;
    layout.liveBoundary = live_boundary;
    return layout;
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    const YAML::Node root = YAML::LoadFile(path.string());
    if (root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("Config file is not a YAML mapping: " + path.string());

    decodeSection(root, "projection", cfg.projection, path);
    decodeSection(root, "fuse", cfg.fuse, path);
    decodeSection(root, "logging", cfg.logging, path);

    return cfg;
}

std::string Config::dump() const {
    YAML::Node root;
    root["projection"] = projection;
    root["fuse"] = fuse;
    root["logging"] = logging;

    YAML::Emitter out;
    out << root;
    return {out.c_str()};
}

void Config::makePathsAbsolute() {
    for (auto* path : {&projection.root_dir, &fuse.mount_path, &logging.log_dir})
        if (!path->empty()) *path = std::filesystem::absolute(*path);
}

}
