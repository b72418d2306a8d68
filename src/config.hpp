// config.hpp
#pragma once

#include <yaml-cpp/yaml.h>
#include <string>

namespace awss {

// Command-line options. Everything else lives in the YAML file.
struct Config {
    std::string config_file = "config/config.yaml";
    std::string data_dir = "";   // overrides pipeline.data_dir when set
    int http_port = 0;           // overrides http.port when > 0
    bool simulate = false;
    bool autostart = false;
    bool verbose = false;
};

Config parse_args(int argc, char* argv[]);

// Loads the YAML file and folds CLI overrides into it. A missing or broken
// file only produces a warning, components fall back to their defaults.
YAML::Node load_config(const Config& cfg);

// Reads config[section][key], falling back when either level is missing.
template <typename T>
T setting(const YAML::Node& config, const std::string& section,
          const std::string& key, const T& fallback) {
    if (!config || !config.IsMap()) return fallback;
    const YAML::Node node = config[section];
    if (!node || !node.IsMap()) return fallback;
    return node[key].as<T>(fallback);
}

}  // namespace awss
