#ifndef BRIDGE_SESSION_HPP
#define BRIDGE_SESSION_HPP

#include <analog_keyboard_state.hpp>
#include <cstddef>
#include <cstdint>

namespace bridge {

  // Relay frame layout: [type][reserved][payload...]
  static constexpr size_t FRAME_HEADER_LENGTH = 2;
  static constexpr size_t FRAME_MIN_LENGTH = 3;
  static constexpr uint8_t FRAME_TYPE_ANALOG = 0x03;

  /**
   * @brief Status and activity bookkeeping for one browser relay connection
   *
   * Holds no socket. BridgeServer drives it through the connection
   * lifecycle and hands it every binary message it reads; all effects land
   * in the shared keyboard state.
   */
  class BridgeSession {
  public:
    explicit BridgeSession(keyboard::AnalogKeyboardState& state);

    /**
     * @brief Reset for the next connection; marks the stream inactive
     */
    void waitForConnection();

    /**
     * @brief WebSocket handshake completed
     */
    void connected();

    /**
     * @brief Handle one binary message from the relay
     * @return true if the message carried an analog report that was applied
     */
    bool handleBinaryFrame(const uint8_t* data, size_t length);

    /**
     * @brief Connection closed or failed; marks the stream inactive
     */
    void ended();

    bool hasAnalog() const { return gotAnalog_; }

  private:
    keyboard::AnalogKeyboardState& state_;
    bool gotAnalog_ = false;
  };

} // namespace bridge

#endif // BRIDGE_SESSION_HPP
