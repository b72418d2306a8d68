// trigger.cpp
#include "trigger.hpp"
#include "config.hpp"
#include "utils.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace awss {

using std::chrono::milliseconds;

// ======= GPIO input =======

namespace {

std::string read_first_line(const fs::path& path) {
    std::ifstream f(path);
    std::string line;
    std::getline(f, line);
    return line;
}

// Lower is better: the header pins live on the RP1 (Pi 5) or the BCM SoC.
int chip_rank(const std::string& label) {
    if (label.rfind("pinctrl-rp1", 0) == 0) return 0;
    if (label.rfind("pinctrl-bcm", 0) == 0) return 1;
    if (label.rfind("pinctrl-", 0) == 0) return 2;
    return 3;
}

}  // namespace

GpioTriggerInput::GpioTriggerInput(int pin, bool active_low, int chip_base,
                                   const std::string& sysfs_root)
    : pin_(pin), active_low_(active_low), chip_base_(chip_base), sysfs_root_(sysfs_root) {}

GpioTriggerInput::~GpioTriggerInput() {
    release();
}

int GpioTriggerInput::resolveChipBase() const {
    if (chip_base_ >= 0) return chip_base_;

    int best_base = 0;
    int best_rank = 4;
    std::error_code ec;
    for (fs::directory_iterator it(sysfs_root_, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name.rfind("gpiochip", 0) != 0) continue;

        int base = 0;
        int ngpio = 0;
        try {
            base = std::stoi(read_first_line(it->path() / "base"));
            ngpio = std::stoi(read_first_line(it->path() / "ngpio"));
        } catch (const std::exception&) {
            Logger::log(Logger::DEBUG, "Skipping unreadable " + it->path().string());
            continue;
        }
        if (pin_ >= ngpio) continue;

        int rank = chip_rank(read_first_line(it->path() / "label"));
        if (rank < best_rank || (rank == best_rank && base < best_base)) {
            best_rank = rank;
            best_base = base;
        }
    }
    return best_base;
}

void GpioTriggerInput::exportPin() {
    number_ = resolveChipBase() + pin_;
    const std::string pin_dir = sysfs_root_ + "/gpio" + std::to_string(number_);
    value_path_ = pin_dir + "/value";

    struct stat st;
    if (stat(pin_dir.c_str(), &st) != 0) {
        std::ofstream exp(sysfs_root_ + "/export");
        if (!exp) {
            throw std::runtime_error("Cannot export GPIO " + std::to_string(pin_) +
                                     " (sysfs " + std::to_string(number_) + ")");
        }
        exp << number_;
        exp.close();
        // udev needs a moment to fix up permissions on the new node
        std::this_thread::sleep_for(milliseconds(100));
    }

    std::ofstream dir(pin_dir + "/direction");
    if (dir) {
        dir << "in";
    }

    Logger::log(Logger::INFO, "IR sensor initialized on GPIO " + std::to_string(pin_) +
                " (sysfs " + std::to_string(number_) + ")" +
                (active_low_ ? " (HIGH=clear, LOW=broken)" : " (LOW=clear, HIGH=broken)"));
    claimed_ = true;
}

void GpioTriggerInput::release() {
    if (!claimed_) return;
    claimed_ = false;

    std::ofstream unexp(sysfs_root_ + "/unexport");
    if (!unexp || !(unexp << number_)) {
        Logger::log(Logger::WARNING, "Could not unexport GPIO " + std::to_string(pin_));
        return;
    }
    Logger::log(Logger::INFO, "IR sensor released (GPIO " + std::to_string(pin_) + ")");
}

bool GpioTriggerInput::read() {
    if (!claimed_) {
        exportPin();
    }

    std::ifstream f(value_path_);
    char level = 0;
    if (!f || !(f >> level) || (level != '0' && level != '1')) {
        throw std::runtime_error("Failed to read GPIO " + std::to_string(pin_) +
                                 " at " + value_path_);
    }
    bool high = (level == '1');
    return active_low_ ? !high : high;
}

// ======= Simulated input =======

SimulatedTriggerInput::SimulatedTriggerInput(const YAML::Node& config) {
    double interval_s = setting<double>(config, "simulation", "auto_trigger_s", 0.0);
    auto_interval_ = milliseconds(static_cast<int64_t>(interval_s * 1000.0));
    auto_pulse_ = milliseconds(setting<int>(config, "simulation", "pulse_ms", 300));
    if (auto_interval_.count() > 0) {
        next_auto_ns_ = nowNs() + std::chrono::duration_cast<std::chrono::nanoseconds>(auto_interval_).count();
    }
}

int64_t SimulatedTriggerInput::nowNs() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        Clock::now().time_since_epoch()).count();
}

bool SimulatedTriggerInput::read() {
    reads_++;

    int pending = fail_reads_.load();
    while (pending > 0) {
        if (fail_reads_.compare_exchange_weak(pending, pending - 1)) {
            throw std::runtime_error("Simulated sensor read failure");
        }
    }

    int64_t now = nowNs();
    if (auto_interval_.count() > 0 && now >= next_auto_ns_.load()) {
        pulse_until_ns_ = now + std::chrono::duration_cast<std::chrono::nanoseconds>(auto_pulse_).count();
        next_auto_ns_ = now + std::chrono::duration_cast<std::chrono::nanoseconds>(auto_interval_).count();
    }

    return active_ || now < pulse_until_ns_.load();
}

void SimulatedTriggerInput::setActive(bool active) {
    active_ = active;
}

void SimulatedTriggerInput::pulse(milliseconds duration) {
    pulse_until_ns_ = nowNs() + std::chrono::duration_cast<std::chrono::nanoseconds>(duration).count();
}

// ======= Debounce state machine =======

TriggerMonitor::TriggerMonitor(TriggerInput& input, const YAML::Node& config)
    : input_(input) {
    poll_ = milliseconds(setting<int>(config, "sensor", "poll_ms", 10));
    debounce_ = milliseconds(setting<int>(config, "sensor", "debounce_ms", 80));
    debounce_poll_ = milliseconds(setting<int>(config, "sensor", "debounce_poll_ms", 5));
}

bool TriggerMonitor::waitForTrigger(const std::atomic<bool>* keep_running) {
    state_ = State::CLEAR;
    auto candidate_since = std::chrono::steady_clock::now();

    while (true) {
        if (keep_running && !keep_running->load()) {
            state_ = State::CLEAR;
            return false;
        }

        bool broken = input_.read();

        switch (state_.load()) {
            case State::CLEAR:
                if (!broken) {
                    armed_ = true;
                    sleep_for(poll_);
                } else if (!armed_) {
                    // still the object we already reported
                    sleep_for(poll_);
                } else {
                    state_ = State::CANDIDATE;
                    candidate_since = std::chrono::steady_clock::now();
                    sleep_for(debounce_poll_);
                }
                break;

            case State::CANDIDATE:
                if (!broken) {
                    rejected_++;
                    Logger::log(Logger::DEBUG, "Trigger rejected as noise");
                    state_ = State::CLEAR;
                    sleep_for(poll_);
                } else if (std::chrono::steady_clock::now() - candidate_since >= debounce_) {
                    state_ = State::CONFIRMED;
                    armed_ = false;
                    confirmed_++;
                    state_ = State::CLEAR;
                    return true;
                } else {
                    sleep_for(debounce_poll_);
                }
                break;

            case State::CONFIRMED:
                state_ = State::CLEAR;
                break;
        }
    }
}

bool TriggerMonitor::isActive() {
    return input_.read();
}

bool TriggerMonitor::waitForClear(milliseconds timeout, milliseconds poll) {
    Timer timer;
    while (input_.read()) {
        if (timer.elapsed() >= timeout) {
            return false;
        }
        sleep_for(poll);
    }
    armed_ = true;
    return true;
}

double TriggerMonitor::verify(milliseconds duration, milliseconds interval) {
    Logger::log(Logger::INFO, "Verifying IR sensor for " + format_fixed(duration.count() / 1000.0, 1) +
                " s, beam should be clear");

    Timer timer;
    int clear_count = 0;
    int total = 0;
    while (timer.elapsed() < duration) {
        if (!input_.read()) {
            clear_count++;
        }
        total++;
        sleep_for(interval);
    }

    double fraction = total > 0 ? static_cast<double>(clear_count) / total : 0.0;
    Logger::log(Logger::INFO, "Beam clear: " + std::to_string(clear_count) + "/" +
                std::to_string(total) + " samples (" + format_fixed(fraction * 100.0, 1) + "%)");
    return fraction;
}

}  // namespace awss
