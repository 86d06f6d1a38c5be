#pragma once

namespace bridge {

/**
 * @brief Browser relay that feeds analog reports into the keyboard state
 *
 * The device watcher creates one through a factory, starts it once and then
 * calls serveSession() on every Bridging cycle while it stays listening.
 */
class Bridge {
public:
    virtual ~Bridge() = default;

    /**
     * @brief Bind the listeners and begin serving the capture page
     * @return false if a listener could not be bound (status already set)
     */
    virtual bool start() = 0;

    /**
     * @brief True once start() succeeded and until cancel()
     */
    virtual bool isListening() const = 0;

    /**
     * @brief Accept one relay connection and service it until it ends
     *
     * Blocks the caller for the whole session.
     */
    virtual void serveSession() = 0;

    /**
     * @brief Unblock serveSession() and stop serving; irreversible
     */
    virtual void cancel() = 0;
};

} // namespace bridge
