#include "device_watcher.hpp"
#include <log.hpp>
#include <utility>

namespace device {

DeviceWatcher::DeviceWatcher(keyboard::AnalogKeyboardState& state,
                             DeviceProbe& probe,
                             BridgeFactory bridgeFactory,
                             WatcherTimings timings)
    : state_(state)
    , probe_(probe)
    , bridgeFactory_(std::move(bridgeFactory))
    , timings_(timings)
{
}

DeviceWatcher::State DeviceWatcher::step(State current)
{
    switch (current) {
    case State::Searching:
        return search();
    case State::Bridging:
        return runBridge();
    }
    return State::Searching;
}

void DeviceWatcher::run()
{
    logInfo("Watching for keyboard %04x:%04x", state_.vid(), state_.pid());

    State current = State::Searching;
    while (!stopRequested_) {
        current = step(current);
    }

    logInfo("Device watcher stopped");
}

void DeviceWatcher::stop()
{
    {
        std::lock_guard<std::mutex> lock(stopMutex_);
        stopRequested_ = true;
    }
    stopCondition_.notify_all();

    std::lock_guard<std::mutex> lock(bridgeMutex_);
    if (bridge_) {
        bridge_->cancel();
    }
}

DeviceWatcher::State DeviceWatcher::search()
{
    if (probe_.isPresent(state_.vid(), state_.pid())) {
        return State::Bridging;
    }

    state_.setStatus("Keyboard not found - plug it in");
    wait(timings_.searchBackoff);
    return State::Searching;
}

DeviceWatcher::State DeviceWatcher::runBridge()
{
    state_.setStatus("Keyboard detected - launching Chrome bridge...");

    bridge::Bridge* bridge = ensureBridge();
    if (bridge != nullptr && !stopRequested_) {
        bridge->serveSession();
    }

    wait(timings_.bridgeRetryDelay);
    return State::Searching;
}

bridge::Bridge* DeviceWatcher::ensureBridge()
{
    std::lock_guard<std::mutex> lock(bridgeMutex_);

    if (bridge_ && bridge_->isListening()) {
        return bridge_.get();
    }

    bridge_ = bridgeFactory_();
    if (!bridge_) {
        logError("Bridge factory returned no bridge");
        return nullptr;
    }

    if (!bridge_->start()) {
        // Status already carries the bind error; retry with a new bridge next cycle
        bridge_.reset();
        return nullptr;
    }
    return bridge_.get();
}

void DeviceWatcher::wait(std::chrono::milliseconds duration)
{
    std::unique_lock<std::mutex> lock(stopMutex_);
    stopCondition_.wait_for(lock, duration, [this] { return stopRequested_.load(); });
}

} // namespace device
