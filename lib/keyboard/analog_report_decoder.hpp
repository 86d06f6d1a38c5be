#ifndef ANALOG_REPORT_DECODER_HPP
#define ANALOG_REPORT_DECODER_HPP

#include "analog_keyboard_state.hpp"
#include <cstddef>
#include <cstdint>

namespace keyboard {

  // Analog report layout: [tag][pad][pad][key][raw_hi][raw_lo], extra bytes ignored
  static constexpr uint8_t ANALOG_REPORT_TAG = 0xA0;
  static constexpr size_t ANALOG_REPORT_MIN_LENGTH = 6;
  static constexpr size_t ANALOG_REPORT_KEY_OFFSET = 3;
  static constexpr size_t ANALOG_REPORT_RAW_OFFSET = 4;

  // Raw sensor units
  static constexpr uint16_t ANALOG_DEADZONE = 10;
  static constexpr float ANALOG_FULL_TRAVEL = 1550.0f;

  /**
   * @brief Convert a raw Hall-effect reading to a 0..1 pressure value
   *
   * Readings at or below the deadzone are 0.0. Readings past full travel
   * clamp to 1.0.
   */
  float normalizeAnalog(uint16_t raw);

  /**
   * @brief Decode one analog report and store its sample
   * @param payload Report bytes, starting with the report tag
   * @param length Number of bytes in payload
   * @param state Destination; only the reported key's value is written
   * @return true if the report was valid and a value was written
   *
   * Short reports and reports with another tag are protocol noise and are
   * dropped without touching state.
   */
  bool decodeAnalogReport(const uint8_t* payload, size_t length, AnalogKeyboardState& state);

} // namespace keyboard

#endif // ANALOG_REPORT_DECODER_HPP
