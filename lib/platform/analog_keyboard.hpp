#pragma once

#include <analog_keyboard_state.hpp>
#include <bridge_config.hpp>
#include <bridge_server.hpp>
#include <browser_launcher.hpp>
#include <device_probe.hpp>
#include <device_watcher.hpp>
#include <log.hpp>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

namespace platform {

/**
 * @brief Analog keyboard as seen by a consumer
 *
 * Owns the shared state and the background watcher thread that detects the
 * keyboard and runs the browser bridge. Platform code supplies the device
 * probe and browser launcher.
 *
 * Every query method may be called from any thread at any time; values are
 * all zero until the bridge streams data.
 */
class AnalogKeyboard {
public:
    AnalogKeyboard(const BridgeConfig& config,
                   std::unique_ptr<device::DeviceProbe> probe,
                   std::unique_ptr<features::BrowserLauncher> launcher)
        : config_(config)
        , state_(config.vendorId, config.productId)
        , probe_(std::move(probe))
        , launcher_(std::move(launcher)) {

        if (!probe_) {
            throw std::invalid_argument("AnalogKeyboard requires a device probe");
        }
        if (!launcher_ || !config_.openBrowser) {
            launcher_ = std::make_unique<features::NoBrowserLauncher>();
        }

        bridge::BridgeOptions bridgeOptions;
        bridgeOptions.reconnectPause = std::chrono::milliseconds(config_.reconnectPauseMs);
        bridgeOptions.acceptPoll = std::chrono::milliseconds(config_.acceptPollMs);
        bridgeOptions.httpReadTimeout = std::chrono::milliseconds(config_.httpReadTimeoutMs);

        device::WatcherTimings timings;
        timings.searchBackoff = std::chrono::milliseconds(config_.searchBackoffMs);
        timings.bridgeRetryDelay = std::chrono::milliseconds(config_.bridgeRetryDelayMs);

        features::BrowserLauncher& launcherRef = *launcher_;
        keyboard::AnalogKeyboardState& stateRef = state_;
        auto bridgeFactory = [&stateRef, &launcherRef, bridgeOptions]() -> std::unique_ptr<bridge::Bridge> {
            return std::make_unique<bridge::BridgeServer>(stateRef, launcherRef, bridgeOptions);
        };

        watcher_ = std::make_unique<device::DeviceWatcher>(state_, *probe_, bridgeFactory, timings);
    }

    ~AnalogKeyboard() {
        stop();
    }

    AnalogKeyboard(const AnalogKeyboard&) = delete;
    AnalogKeyboard& operator=(const AnalogKeyboard&) = delete;

    /**
     * @brief Spawn the watcher thread; later calls do nothing
     */
    void start() {
        if (watcherThread_.joinable()) {
            return;
        }
        watcherThread_ = std::thread([this]() { watcher_->run(); });
    }

    /**
     * @brief Stop the watcher thread and wait for it
     *
     * Optional: without it the watcher runs until the process exits.
     */
    void stop() {
        if (!watcherThread_.joinable()) {
            return;
        }
        watcher_->stop();
        watcherThread_.join();
    }

    keyboard::AnalogKeyboardState::Values values() const { return state_.values(); }
    float value(uint8_t code) const { return state_.value(code); }
    void setValues(const keyboard::AnalogKeyboardState::Values& values) { state_.setValues(values); }
    bool isActive() const { return state_.isActive(); }
    std::string status() const { return state_.status(); }
    uint16_t vid() const { return state_.vid(); }
    uint16_t pid() const { return state_.pid(); }

    const keyboard::AnalogKeyboardState& state() const { return state_; }
    const BridgeConfig& config() const { return config_; }

private:
    BridgeConfig config_;
    keyboard::AnalogKeyboardState state_;
    std::unique_ptr<device::DeviceProbe> probe_;
    std::unique_ptr<features::BrowserLauncher> launcher_;
    std::unique_ptr<device::DeviceWatcher> watcher_;
    std::thread watcherThread_;
};

} // namespace platform
