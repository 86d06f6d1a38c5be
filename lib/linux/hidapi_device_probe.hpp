#ifndef HIDAPI_DEVICE_PROBE_HPP
#define HIDAPI_DEVICE_PROBE_HPP

#include <device_probe.hpp>
#include <log.hpp>
#include <hidapi/hidapi.h>
#include <cstdint>
#include <string>
#include <vector>

namespace linux {

/**
 * @brief Information about an attached HID device
 */
struct HidDeviceInfo {
    uint16_t vendorId;
    uint16_t productId;
    std::string path;        // e.g., "/dev/hidraw3"
    std::string description; // Manufacturer and product strings
};

/**
 * @brief HID device presence check backed by hidapi
 *
 * Enumeration is repeated on every probe so hot-plugged devices show up.
 * If hidapi fails to initialize, every probe reports "not present" and
 * initialization is retried on the next probe.
 */
class HidApiDeviceProbe : public device::DeviceProbe {
public:
    HidApiDeviceProbe() {
        initialized_ = (hid_init() == 0);
        if (!initialized_) {
            logWarn("hidapi initialization failed");
        }
    }

    ~HidApiDeviceProbe() {
        if (initialized_) {
            hid_exit();
        }
    }

    HidApiDeviceProbe(const HidApiDeviceProbe&) = delete;
    HidApiDeviceProbe& operator=(const HidApiDeviceProbe&) = delete;

    bool isPresent(uint16_t vendorId, uint16_t productId) override {
        if (!initialized_) {
            initialized_ = (hid_init() == 0);
            if (!initialized_) {
                return false;
            }
        }

        hid_device_info* devices = hid_enumerate(vendorId, productId);
        bool found = false;
        for (hid_device_info* d = devices; d != nullptr; d = d->next) {
            if (d->vendor_id == vendorId && d->product_id == productId) {
                found = true;
                break;
            }
        }
        hid_free_enumeration(devices);
        return found;
    }

    /**
     * @brief List every attached HID device
     * @return Empty if hidapi is unavailable
     */
    std::vector<HidDeviceInfo> listDevices() {
        std::vector<HidDeviceInfo> result;
        if (!initialized_) {
            return result;
        }

        hid_device_info* devices = hid_enumerate(0, 0);
        for (hid_device_info* d = devices; d != nullptr; d = d->next) {
            HidDeviceInfo info;
            info.vendorId = d->vendor_id;
            info.productId = d->product_id;
            info.path = d->path ? d->path : "";
            info.description = narrow(d->manufacturer_string) + " " + narrow(d->product_string);
            result.push_back(info);
        }
        hid_free_enumeration(devices);
        return result;
    }

private:
    bool initialized_ = false;

    // hidapi reports strings as wchar_t; device names are ASCII in practice
    static std::string narrow(const wchar_t* text) {
        std::string out;
        if (text == nullptr) {
            return out;
        }
        for (; *text != L'\0'; ++text) {
            out.push_back(*text < 0x80 ? static_cast<char>(*text) : '?');
        }
        return out;
    }
};

} // namespace linux

#endif // HIDAPI_DEVICE_PROBE_HPP
