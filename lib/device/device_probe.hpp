#pragma once

#include <cstdint>

namespace device {

/**
 * @brief Platform-agnostic check for an attached HID device
 *
 * Implementations enumerate whatever the platform exposes. A probe that
 * cannot enumerate at all reports the device as absent.
 */
class DeviceProbe {
public:
    virtual ~DeviceProbe() = default;

    /**
     * @brief Check whether a device with this vendor/product id is attached
     * @return true if at least one matching device was enumerated
     */
    virtual bool isPresent(uint16_t vendorId, uint16_t productId) = 0;
};

} // namespace device
