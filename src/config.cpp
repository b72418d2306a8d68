// config.cpp
#include "config.hpp"
#include "utils.hpp"
#include <getopt.h>
#include <cstdlib>
#include <iostream>

namespace awss {

Config parse_args(int argc, char* argv[]) {
    Config cfg;

    static struct option long_options[] = {
        {"config", required_argument, 0, 'c'},
        {"http-port", required_argument, 0, 'P'},
        {"data-dir", required_argument, 0, 'd'},
        {"simulate", no_argument, 0, 's'},
        {"autostart", no_argument, 0, 'a'},
        {"verbose", no_argument, 0, 'v'},
        {"help", no_argument, 0, '?'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;
    optind = 1;

    while ((opt = getopt_long(argc, argv, "c:P:d:sav?",
                              long_options, &option_index)) != -1) {
        switch (opt) {
            case 'c': cfg.config_file = optarg; break;
            case 'P': cfg.http_port = std::stoi(optarg); break;
            case 'd': cfg.data_dir = optarg; break;
            case 's': cfg.simulate = true; break;
            case 'a': cfg.autostart = true; break;
            case 'v': cfg.verbose = true; break;
            case '?':
                std::cout << "Usage: " << argv[0] << " [options]\n"
                          << "Options:\n"
                          << "  -c, --config FILE       Config file path (default: config/config.yaml)\n"
                          << "  -P, --http-port PORT    HTTP control port (default: 5050)\n"
                          << "  -d, --data-dir DIR      Root for captures/ and logs/ (default: data)\n"
                          << "  -s, --simulate          Use simulated sensor and camera\n"
                          << "  -a, --autostart         Start the engine without waiting for /api/start\n"
                          << "  -v, --verbose           Debug logging\n"
                          << "  --help                  Show this help\n";
                std::exit(0);
        }
    }

    return cfg;
}

YAML::Node load_config(const Config& cfg) {
    YAML::Node yaml_config;
    try {
        yaml_config = YAML::LoadFile(cfg.config_file);
    } catch (const std::exception& e) {
        Logger::log(Logger::WARNING, std::string("Could not load config file: ") + e.what());
    }
    if (!yaml_config.IsMap()) {
        yaml_config = YAML::Node(YAML::NodeType::Map);
    }

    if (!cfg.data_dir.empty()) {
        yaml_config["pipeline"]["data_dir"] = cfg.data_dir;
    }
    if (cfg.http_port > 0) {
        yaml_config["http"]["port"] = cfg.http_port;
    }
    if (cfg.simulate) {
        yaml_config["simulation"]["enabled"] = true;
    }
    if (cfg.verbose) {
        yaml_config["logging"]["level"] = "debug";
    }
    return yaml_config;
}

}  // namespace awss
