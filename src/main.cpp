// main.cpp
// Waste sorting station: breakbeam trigger, camera, colour classifier and
// HTTP control interface.
#include <iostream>
#include <memory>
#include <thread>
#include <atomic>
#include <chrono>
#include <csignal>
#include <yaml-cpp/yaml.h>

#include "capture.hpp"
#include "config.hpp"
#include "engine.hpp"
#include "http_server.hpp"
#include "trigger.hpp"
#include "utils.hpp"

using namespace std::chrono;

std::atomic<bool> g_running{true};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        std::cout << "\nShutting down..." << std::endl;
        g_running = false;
    }
}

int main(int argc, char* argv[]) {
    awss::Config cfg = awss::parse_args(argc, argv);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    YAML::Node yaml_config = awss::load_config(cfg);
    awss::Logger::setLevel(awss::Logger::parseLevel(
        awss::setting<std::string>(yaml_config, "logging", "level", "info")));

    const bool simulate = awss::setting<bool>(yaml_config, "simulation", "enabled", false);
    const int http_port = awss::setting<int>(yaml_config, "http", "port", 5050);

    std::unique_ptr<awss::TriggerInput> trigger;
    std::unique_ptr<awss::FrameSource> camera;
    if (simulate) {
        trigger = std::make_unique<awss::SimulatedTriggerInput>(yaml_config);
        camera = std::make_unique<awss::SimulatedFrameSource>(yaml_config);
    } else {
        trigger = std::make_unique<awss::GpioTriggerInput>(
            awss::setting<int>(yaml_config, "sensor", "pin", 23),
            awss::setting<bool>(yaml_config, "sensor", "active_low", true),
            awss::setting<int>(yaml_config, "sensor", "gpio_base", -1));
        camera = std::make_unique<awss::FrameCapture>(yaml_config);
    }

    std::cout << "Starting AWSS station..." << std::endl;
    std::cout << "Hardware: " << (simulate ? "SIMULATION" : "GPIO sensor + camera") << std::endl;
    std::cout << "Data dir: " << awss::setting<std::string>(yaml_config, "pipeline", "data_dir", "data") << std::endl;
    std::cout << "HTTP interface: http://localhost:" << http_port << std::endl;
    std::cout << "Press Ctrl+C to stop" << std::endl;

    int exit_code = 0;
    {
        awss::SortingEngine engine(yaml_config, std::move(trigger), std::move(camera));
        awss::HttpControlServer server(engine, http_port);

        if (!server.start()) {
            std::cerr << "Failed to start HTTP interface!" << std::endl;
            return -1;
        }

        if (cfg.autostart && !engine.start()) {
            std::cerr << "Failed to start engine!" << std::endl;
            exit_code = -1;
            g_running = false;
        }

        while (g_running) {
            std::this_thread::sleep_for(milliseconds(200));
        }

        server.stop();
        engine.stop();
    }

    std::cout << "\nShutdown complete." << std::endl;
    return exit_code;
}
