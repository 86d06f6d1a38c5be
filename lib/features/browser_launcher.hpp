#pragma once

#include <string>

namespace features {

/**
 * @brief Opens a URL in the user's default browser
 *
 * Launching is best effort: the caller reports a failure and carries on,
 * since the user can still open the URL by hand.
 */
class BrowserLauncher {
public:
    virtual ~BrowserLauncher() = default;

    /**
     * @brief Ask the platform to open url
     * @return false if the launch could not be started
     */
    virtual bool openUrl(const std::string& url) = 0;
};

/**
 * @brief Null object implementation - never opens anything
 *
 * Use when browser launching is disabled in the configuration.
 */
class NoBrowserLauncher : public BrowserLauncher {
public:
    bool openUrl(const std::string& /*url*/) override {
        return true;
    }
};

} // namespace features
