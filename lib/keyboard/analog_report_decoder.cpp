#include "analog_report_decoder.hpp"
#include <algorithm>

namespace keyboard {

float normalizeAnalog(uint16_t raw)
{
    if (raw <= ANALOG_DEADZONE) {
        return 0.0f;
    }

    float travel = static_cast<float>(raw - ANALOG_DEADZONE) / ANALOG_FULL_TRAVEL;
    return std::max(0.0f, std::min(1.0f, travel));
}

bool decodeAnalogReport(const uint8_t* payload, size_t length, AnalogKeyboardState& state)
{
    if (payload == nullptr || length < ANALOG_REPORT_MIN_LENGTH) {
        return false;
    }
    if (payload[0] != ANALOG_REPORT_TAG) {
        return false;
    }

    uint8_t keyIndex = payload[ANALOG_REPORT_KEY_OFFSET];
    uint16_t raw = static_cast<uint16_t>((payload[ANALOG_REPORT_RAW_OFFSET] << 8)
                                         | payload[ANALOG_REPORT_RAW_OFFSET + 1]);

    state.setValue(keyIndex, normalizeAnalog(raw));
    return true;
}

} // namespace keyboard
