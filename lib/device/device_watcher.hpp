#ifndef DEVICE_WATCHER_HPP
#define DEVICE_WATCHER_HPP

#include "device_probe.hpp"
#include <analog_keyboard_state.hpp>
#include <bridge.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>

namespace device {

/**
 * @brief Delays between watcher cycles
 */
struct WatcherTimings {
    std::chrono::milliseconds searchBackoff{2000};     // device absent
    std::chrono::milliseconds bridgeRetryDelay{2000};  // after a bridge cycle
};

/**
 * @brief Supervises device presence and the browser bridge
 *
 * Two-state machine:
 *   Searching --device found--> Bridging
 *   Bridging --session ended / bind failed--> Searching
 *
 * A bridge that bound successfully is kept and reused for later sessions.
 * One that failed to bind is dropped and a fresh one is created on the next
 * Bridging cycle. Device removal is only noticed when the session's relay
 * connection drops.
 */
class DeviceWatcher {
public:
    enum class State {
        Searching,
        Bridging,
    };

    using BridgeFactory = std::function<std::unique_ptr<bridge::Bridge>()>;

    /**
     * @param state Shared keyboard state; vid/pid select the device
     * @param probe Device presence check (must outlive the watcher)
     * @param bridgeFactory Creates a bridge when one is needed
     * @param timings Retry delays
     */
    DeviceWatcher(keyboard::AnalogKeyboardState& state,
                  DeviceProbe& probe,
                  BridgeFactory bridgeFactory,
                  WatcherTimings timings);

    DeviceWatcher(const DeviceWatcher&) = delete;
    DeviceWatcher& operator=(const DeviceWatcher&) = delete;

    /**
     * @brief Run one state transition
     * @return The state to run next
     */
    State step(State current);

    /**
     * @brief Loop step() from Searching until stop() is called
     */
    void run();

    /**
     * @brief Ask run() to return; wakes pending delays and cancels the bridge
     *
     * Safe to call from any thread.
     */
    void stop();

    bool stopRequested() const { return stopRequested_; }

private:
    keyboard::AnalogKeyboardState& state_;
    DeviceProbe& probe_;
    BridgeFactory bridgeFactory_;
    WatcherTimings timings_;

    std::mutex bridgeMutex_;
    std::unique_ptr<bridge::Bridge> bridge_;

    std::atomic<bool> stopRequested_{false};
    std::mutex stopMutex_;
    std::condition_variable stopCondition_;

    State search();
    State runBridge();
    bridge::Bridge* ensureBridge();
    void wait(std::chrono::milliseconds duration);
};

} // namespace device

#endif // DEVICE_WATCHER_HPP
