#include "analog_keyboard_state.hpp"
#include <log.hpp>
#include <algorithm>
#include <system_error>

namespace keyboard {

constexpr size_t AnalogKeyboardState::KEY_COUNT;

AnalogKeyboardState::AnalogKeyboardState(uint16_t vendorId, uint16_t productId)
    : vendorId_(vendorId)
    , productId_(productId)
    , status_("Starting...")
{
    values_.fill(0.0f);
}

AnalogKeyboardState::Values AnalogKeyboardState::values() const
{
    try {
        std::lock_guard<std::mutex> lock(valuesMutex_);
        return values_;
    } catch (const std::system_error& e) {
        logWarn("values lock failed: %s", e.what());
        Values zeros;
        zeros.fill(0.0f);
        return zeros;
    }
}

float AnalogKeyboardState::value(size_t code) const
{
    if (code >= KEY_COUNT) {
        return 0.0f;
    }

    try {
        std::lock_guard<std::mutex> lock(valuesMutex_);
        return values_[code];
    } catch (const std::system_error& e) {
        logWarn("values lock failed: %s", e.what());
        return 0.0f;
    }
}

void AnalogKeyboardState::setValues(const Values& values)
{
    Values clamped;
    std::transform(values.begin(), values.end(), clamped.begin(), clampUnit);

    try {
        std::lock_guard<std::mutex> lock(valuesMutex_);
        values_ = clamped;
    } catch (const std::system_error& e) {
        logWarn("values lock failed, update dropped: %s", e.what());
    }
}

bool AnalogKeyboardState::isActive() const
{
    try {
        std::lock_guard<std::mutex> lock(activeMutex_);
        return active_;
    } catch (const std::system_error& e) {
        logWarn("active lock failed: %s", e.what());
        return false;
    }
}

std::string AnalogKeyboardState::status() const
{
    try {
        std::lock_guard<std::mutex> lock(statusMutex_);
        return status_;
    } catch (const std::system_error& e) {
        logWarn("status lock failed: %s", e.what());
        return std::string();
    }
}

void AnalogKeyboardState::setValue(size_t code, float value)
{
    if (code >= KEY_COUNT) {
        return;
    }

    float clamped = clampUnit(value);
    try {
        std::lock_guard<std::mutex> lock(valuesMutex_);
        values_[code] = clamped;
    } catch (const std::system_error& e) {
        logWarn("values lock failed, update dropped: %s", e.what());
    }
}

void AnalogKeyboardState::setActive(bool active)
{
    try {
        std::lock_guard<std::mutex> lock(activeMutex_);
        active_ = active;
    } catch (const std::system_error& e) {
        logWarn("active lock failed, update dropped: %s", e.what());
    }
}

void AnalogKeyboardState::setStatus(const std::string& status)
{
    bool changed = true;
    try {
        std::lock_guard<std::mutex> lock(statusMutex_);
        changed = (status_ != status);
        status_ = status;
    } catch (const std::system_error& e) {
        logWarn("status lock failed, update dropped: %s", e.what());
    }

    if (changed) {
        logInfo("[HID] %s", status.c_str());
    }
}

size_t AnalogKeyboardState::countAbove(float threshold) const
{
    try {
        std::lock_guard<std::mutex> lock(valuesMutex_);
        return static_cast<size_t>(std::count_if(values_.begin(), values_.end(),
            [threshold](float v) { return v > threshold; }));
    } catch (const std::system_error& e) {
        logWarn("values lock failed: %s", e.what());
        return 0;
    }
}

float AnalogKeyboardState::clampUnit(float value)
{
    // NaN compares false both ways and would otherwise pass through
    if (!(value > 0.0f)) {
        return 0.0f;
    }
    return std::min(1.0f, value);
}

} // namespace keyboard
