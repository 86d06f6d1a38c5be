#ifndef BRIDGE_SERVER_HPP
#define BRIDGE_SERVER_HPP

#include "bridge.hpp"
#include "bridge_session.hpp"
#include <analog_keyboard_state.hpp>
#include <browser_launcher.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace bridge {

/**
 * @brief Timing knobs for BridgeServer
 */
struct BridgeOptions {
    std::chrono::milliseconds reconnectPause{500};   // after a session ends
    std::chrono::milliseconds acceptPoll{100};       // listener poll period
    std::chrono::milliseconds httpReadTimeout{2000}; // per HTTP request
};

/**
 * @brief Loopback HTTP + WebSocket relay between the capture page and the keyboard state
 *
 * start() binds two listeners on 127.0.0.1 with OS-assigned ports. The HTTP
 * listener serves the rendered capture page to every request from its own
 * thread. serveSession() accepts one WebSocket connection on the caller's
 * thread and feeds its binary messages to a BridgeSession until the
 * connection closes.
 *
 * Listeners stay bound for the lifetime of the object, so the page URL and
 * relay port do not change between sessions.
 */
class BridgeServer : public Bridge {
public:
    /**
     * @param state Shared keyboard state (must outlive the server)
     * @param launcher Browser launcher (must outlive the server)
     * @param options Timing configuration
     */
    BridgeServer(keyboard::AnalogKeyboardState& state,
                 features::BrowserLauncher& launcher,
                 BridgeOptions options);

    ~BridgeServer() override;

    BridgeServer(const BridgeServer&) = delete;
    BridgeServer& operator=(const BridgeServer&) = delete;

    bool start() override;
    bool isListening() const override;
    void serveSession() override;
    void cancel() override;

    uint16_t httpPort() const { return httpPort_; }
    uint16_t wsPort() const { return wsPort_; }

    /**
     * @brief http://127.0.0.1:<httpPort>
     */
    std::string pageUrl() const;

private:
    using tcp = boost::asio::ip::tcp;

    keyboard::AnalogKeyboardState& state_;
    features::BrowserLauncher& launcher_;
    BridgeOptions options_;
    BridgeSession session_;

    boost::asio::io_context ioContext_;
    tcp::acceptor httpAcceptor_;
    tcp::acceptor wsAcceptor_;
    uint16_t httpPort_ = 0;
    uint16_t wsPort_ = 0;
    std::string httpResponse_;
    std::thread httpThread_;

    std::atomic<bool> listening_{false};
    std::atomic<bool> stopping_{false};
    std::mutex stopMutex_;
    std::condition_variable stopCondition_;

    // Native handle of the relay connection being serviced, -1 if none
    std::mutex activeMutex_;
    int activeSocket_ = -1;

    bool bindListener(tcp::acceptor& acceptor, const char* label);
    bool pollAccept(tcp::acceptor& acceptor, tcp::socket& socket);
    bool waitUnlessStopping(std::chrono::milliseconds duration);

    void httpLoop();
    void serveHttpClient(tcp::socket& socket);

    void setActiveSocket(int nativeHandle);
    void clearActiveSocket();
};

} // namespace bridge

#endif // BRIDGE_SERVER_HPP
