#ifndef ANALOG_KEYBOARD_STATE_HPP
#define ANALOG_KEYBOARD_STATE_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>

namespace keyboard {

/**
 * @brief Thread-safe analog keyboard state
 *
 * Holds one normalized pressure value (0.0 = released, 1.0 = fully pressed)
 * per HID usage code, plus the bridge activity flag and a human-readable
 * status line.
 *
 * Writers are the device watcher and bridge threads; any number of consumer
 * threads may read at any time. Values, active flag and status each have
 * their own mutex so a reader of one field never waits on a writer of
 * another. If a mutex cannot be locked, reads return a safe default
 * (0.0 / false / empty string) and writes are dropped.
 */
class AnalogKeyboardState {
public:
    static constexpr size_t KEY_COUNT = 256;
    using Values = std::array<float, KEY_COUNT>;

    /**
     * @param vendorId HID vendor id of the target keyboard
     * @param productId HID product id of the target keyboard
     */
    AnalogKeyboardState(uint16_t vendorId, uint16_t productId);

    AnalogKeyboardState(const AnalogKeyboardState&) = delete;
    AnalogKeyboardState& operator=(const AnalogKeyboardState&) = delete;

    /**
     * @brief Snapshot of all 256 values, copied under a single lock
     */
    Values values() const;

    /**
     * @brief Value for one HID usage code
     * @return 0.0 if code is outside 0..255
     */
    float value(size_t code) const;

    /**
     * @brief Replace every value at once (digital fallback input path)
     *
     * Entries are clamped to [0, 1]. Readers see either the previous or the
     * new sequence as a whole.
     */
    void setValues(const Values& values);

    bool isActive() const;
    std::string status() const;

    uint16_t vid() const { return vendorId_; }
    uint16_t pid() const { return productId_; }

    // Bridge-side mutators

    /**
     * @brief Overwrite a single value; out-of-range codes are ignored
     */
    void setValue(size_t code, float value);

    void setActive(bool active);

    /**
     * @brief Publish a new status line
     *
     * Written to the log when it differs from the current one.
     */
    void setStatus(const std::string& status);

    /**
     * @brief Number of keys whose value is strictly above threshold
     */
    size_t countAbove(float threshold) const;

private:
    const uint16_t vendorId_;
    const uint16_t productId_;

    mutable std::mutex valuesMutex_;
    Values values_;

    mutable std::mutex activeMutex_;
    bool active_ = false;

    mutable std::mutex statusMutex_;
    std::string status_;

    static float clampUnit(float value);
};

} // namespace keyboard

#endif // ANALOG_KEYBOARD_STATE_HPP
