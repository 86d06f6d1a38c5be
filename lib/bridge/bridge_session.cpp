#include "bridge_session.hpp"
#include <analog_report_decoder.hpp>
#include <keyboard_snapshot.hpp>
#include <log.hpp>
#include <string>

namespace bridge {

BridgeSession::BridgeSession(keyboard::AnalogKeyboardState& state)
    : state_(state)
{
}

void BridgeSession::waitForConnection()
{
    gotAnalog_ = false;
    state_.setStatus("Waiting for Chrome connection...");
    state_.setActive(false);
}

void BridgeSession::connected()
{
    state_.setStatus("Chrome connected - click Connect in browser");
}

bool BridgeSession::handleBinaryFrame(const uint8_t* data, size_t length)
{
    if (data == nullptr || length < FRAME_MIN_LENGTH) {
        return false;
    }

    if (data[0] != FRAME_TYPE_ANALOG) {
        logDebug("Ignoring relay frame type 0x%02X", data[0]);
        return false;
    }

    if (!gotAnalog_) {
        gotAnalog_ = true;
        state_.setActive(true);
        state_.setStatus("Analog active!");
    }

    bool applied = keyboard::decodeAnalogReport(data + FRAME_HEADER_LENGTH,
                                                length - FRAME_HEADER_LENGTH,
                                                state_);

    size_t pressed = state_.countAbove(keyboard::KeyboardSnapshot::PRESSED_THRESHOLD);
    state_.setStatus("Analog active! (" + std::to_string(pressed) + " keys)");
    return applied;
}

void BridgeSession::ended()
{
    state_.setActive(false);
    state_.setStatus("Chrome disconnected - reconnecting...");
}

} // namespace bridge
