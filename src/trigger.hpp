// trigger.hpp
#pragma once

#include <yaml-cpp/yaml.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace awss {

// Raw digital input: true while the beam is broken.
// read() throws std::runtime_error when the line cannot be sampled.
class TriggerInput {
public:
    virtual ~TriggerInput() = default;
    virtual bool read() = 0;
    // Hands the line back to the system. The next read() claims it again.
    virtual void release() {}
};

/**
 * Breakbeam receiver on a Linux sysfs GPIO line.
 * The receiver pulls the line HIGH while the beam is clear and drives it LOW
 * when an object breaks it, so active_low defaults to true.
 *
 * sysfs cannot set the pin bias: the line needs a pull-up on the board or
 * from the firmware (`gpio=23=ip,pu` in config.txt on a Raspberry Pi).
 *
 * `pin` is the BCM offset. With chip_base < 0 the base of the SoC pin
 * controller is looked up under sysfs_root (0 on older kernels, 512 on
 * newer ones).
 */
class GpioTriggerInput : public TriggerInput {
public:
    GpioTriggerInput(int pin, bool active_low = true, int chip_base = -1,
                     const std::string& sysfs_root = "/sys/class/gpio");
    ~GpioTriggerInput() override;

    bool read() override;
    void release() override;

    int pin() const { return pin_; }
    // Global sysfs number, known once the line has been claimed.
    int sysfsNumber() const { return number_; }
    bool claimed() const { return claimed_; }

private:
    int pin_;
    bool active_low_;
    int chip_base_;
    std::string sysfs_root_;
    int number_{-1};
    std::string value_path_;
    bool claimed_{false};

    int resolveChipBase() const;
    void exportPin();
};

// Software breakbeam for bench runs and tests.
class SimulatedTriggerInput : public TriggerInput {
public:
    SimulatedTriggerInput() = default;
    explicit SimulatedTriggerInput(const YAML::Node& config);

    bool read() override;

    void setActive(bool active);
    // Broken for `duration` starting now, clear afterwards.
    void pulse(std::chrono::milliseconds duration);
    // The next n reads throw.
    void failNextReads(int n) { fail_reads_ = n; }

    uint64_t reads() const { return reads_; }

private:
    using Clock = std::chrono::steady_clock;

    std::atomic<bool> active_{false};
    std::atomic<int64_t> pulse_until_ns_{0};
    std::atomic<int> fail_reads_{0};
    std::atomic<uint64_t> reads_{0};

    std::chrono::milliseconds auto_interval_{0};
    std::chrono::milliseconds auto_pulse_{std::chrono::milliseconds(300)};
    std::atomic<int64_t> next_auto_ns_{0};

    static int64_t nowNs();
};

/**
 * Debounces a TriggerInput into confirmed "object present" events.
 *
 *   CLEAR --broken--> CANDIDATE --held for debounce window--> CONFIRMED --> CLEAR
 *                         |
 *                         +--clear inside window (noise)--> CLEAR
 *
 * After a confirmation the monitor stays disarmed until it sees the beam
 * clear again, so a bag parked in the beam is reported once.
 */
class TriggerMonitor {
public:
    enum class State { CLEAR, CANDIDATE, CONFIRMED };

    TriggerMonitor(TriggerInput& input, const YAML::Node& config);

    // Blocks until a trigger is confirmed (true) or *keep_running reads false
    // at a poll tick (false). With no flag it never gives up.
    bool waitForTrigger(const std::atomic<bool>* keep_running = nullptr);

    bool isActive();

    // True once the beam reads clear, false if `timeout` expired first.
    bool waitForClear(std::chrono::milliseconds timeout,
                      std::chrono::milliseconds poll = std::chrono::milliseconds(50));

    // Fraction of samples over `duration` that read clear. Diagnostic only.
    double verify(std::chrono::milliseconds duration,
                  std::chrono::milliseconds interval = std::chrono::milliseconds(100));

    State state() const { return state_; }
    uint64_t confirmedCount() const { return confirmed_; }
    uint64_t rejectedCount() const { return rejected_; }
    std::chrono::milliseconds debounceWindow() const { return debounce_; }

private:
    TriggerInput& input_;
    std::chrono::milliseconds poll_;
    std::chrono::milliseconds debounce_;
    std::chrono::milliseconds debounce_poll_;

    std::atomic<State> state_{State::CLEAR};
    bool armed_{true};
    std::atomic<uint64_t> confirmed_{0};
    std::atomic<uint64_t> rejected_{0};
};

}  // namespace awss
