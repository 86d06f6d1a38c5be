#ifndef KEYBOARD_SNAPSHOT_HPP
#define KEYBOARD_SNAPSHOT_HPP

#include "analog_keyboard_state.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace keyboard {

/**
 * @brief Point-in-time view of the keyboard for telemetry output
 *
 * Only keys above PRESSED_THRESHOLD are listed, in ascending code order.
 */
struct KeyboardSnapshot {
    static constexpr float PRESSED_THRESHOLD = 0.01f;

    struct Key {
        uint8_t code = 0;
        float value = 0.0f;

        bool operator==(const Key& other) const {
            return code == other.code && value == other.value;
        }
    };

    bool active = false;
    std::string status;
    std::vector<Key> keys;

    static KeyboardSnapshot capture(const AnalogKeyboardState& state) {
        KeyboardSnapshot snapshot;
        snapshot.active = state.isActive();
        snapshot.status = state.status();

        AnalogKeyboardState::Values values = state.values();
        for (size_t code = 0; code < values.size(); ++code) {
            if (values[code] > PRESSED_THRESHOLD) {
                Key key;
                key.code = static_cast<uint8_t>(code);
                key.value = values[code];
                snapshot.keys.push_back(key);
            }
        }
        return snapshot;
    }

    bool operator==(const KeyboardSnapshot& other) const {
        return active == other.active && status == other.status && keys == other.keys;
    }

    bool operator!=(const KeyboardSnapshot& other) const {
        return !(*this == other);
    }
};

inline void to_json(nlohmann::json& j, const KeyboardSnapshot::Key& key) {
    j = nlohmann::json{{"code", key.code}, {"value", key.value}};
}

inline void to_json(nlohmann::json& j, const KeyboardSnapshot& snapshot) {
    j = nlohmann::json{
        {"active", snapshot.active},
        {"status", snapshot.status},
        {"keys", snapshot.keys}
    };
}

} // namespace keyboard

#endif // KEYBOARD_SNAPSHOT_HPP
