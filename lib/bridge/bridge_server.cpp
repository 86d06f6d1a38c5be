#include "bridge_server.hpp"
#include "bridge_page.hpp"
#include "bridge_page_template.hpp"
#include <log.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/websocket.hpp>
#include <poll.h>
#include <sys/socket.h>
#include <array>
#include <utility>

namespace bridge {

namespace asio = boost::asio;
namespace websocket = boost::beast::websocket;

// Largest relay message accepted; analog reports are a few dozen bytes
static constexpr size_t MAX_RELAY_MESSAGE = 64 * 1024;

BridgeServer::BridgeServer(keyboard::AnalogKeyboardState& state,
                           features::BrowserLauncher& launcher,
                           BridgeOptions options)
    : state_(state)
    , launcher_(launcher)
    , options_(options)
    , session_(state)
    , httpAcceptor_(ioContext_)
    , wsAcceptor_(ioContext_)
{
}

BridgeServer::~BridgeServer()
{
    cancel();
    if (httpThread_.joinable()) {
        httpThread_.join();
    }
}

bool BridgeServer::start()
{
    if (stopping_) {
        return false;
    }
    if (listening_) {
        return true;
    }

    if (!bindListener(httpAcceptor_, "HTTP")) {
        return false;
    }
    if (!bindListener(wsAcceptor_, "WS")) {
        boost::system::error_code ignored;
        httpAcceptor_.close(ignored);
        return false;
    }

    boost::system::error_code ec;
    httpPort_ = httpAcceptor_.local_endpoint(ec).port();
    wsPort_ = wsAcceptor_.local_endpoint(ec).port();

    std::string page = renderBridgePage(BRIDGE_PAGE_TEMPLATE, wsPort_, state_.vid(), state_.pid());
    httpResponse_ = buildHttpResponse(page);
    logInfo("Bridge listening: http %u, ws %u", httpPort_, wsPort_);

    listening_ = true;
    httpThread_ = std::thread(&BridgeServer::httpLoop, this);

    std::string url = pageUrl();
    state_.setStatus("Open Chrome -> " + url);
    if (!launcher_.openUrl(url)) {
        state_.setStatus("Browser launch failed - open " + url + " manually");
    }
    return true;
}

bool BridgeServer::isListening() const
{
    return listening_ && !stopping_;
}

std::string BridgeServer::pageUrl() const
{
    return "http://127.0.0.1:" + std::to_string(httpPort_);
}

void BridgeServer::serveSession()
{
    if (!isListening()) {
        return;
    }

    session_.waitForConnection();

    while (true) {
        tcp::socket socket(ioContext_);
        if (!pollAccept(wsAcceptor_, socket)) {
            // Stopped while waiting; nothing was connected
            return;
        }

        websocket::stream<tcp::socket> ws(std::move(socket));
        setActiveSocket(ws.next_layer().native_handle());

        boost::system::error_code ec;
        ws.read_message_max(MAX_RELAY_MESSAGE);
        ws.accept(ec);
        if (ec) {
            clearActiveSocket();
            logDebug("WebSocket handshake failed: %s", ec.message().c_str());
            continue;
        }

        session_.connected();

        boost::beast::flat_buffer buffer;
        while (true) {
            ws.read(buffer, ec);
            if (ec) {
                if (ec == websocket::error::closed) {
                    logDebug("Relay closed by browser");
                } else {
                    logDebug("Relay read ended: %s", ec.message().c_str());
                }
                break;
            }

            if (ws.got_binary()) {
                auto data = buffer.data();
                session_.handleBinaryFrame(static_cast<const uint8_t*>(data.data()), data.size());
            }
            buffer.consume(buffer.size());
        }

        clearActiveSocket();
        break;
    }

    session_.ended();
    waitUnlessStopping(options_.reconnectPause);
}

void BridgeServer::cancel()
{
    {
        std::lock_guard<std::mutex> lock(stopMutex_);
        stopping_ = true;
    }
    stopCondition_.notify_all();

    std::lock_guard<std::mutex> lock(activeMutex_);
    if (activeSocket_ >= 0) {
        // Unblocks the pending handshake or read on the session thread
        ::shutdown(activeSocket_, SHUT_RDWR);
    }
}

bool BridgeServer::bindListener(tcp::acceptor& acceptor, const char* label)
{
    tcp::endpoint endpoint(asio::ip::address_v4::loopback(), 0);
    boost::system::error_code ec;

    acceptor.open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor.bind(endpoint, ec);
    }
    if (!ec) {
        acceptor.listen(asio::socket_base::max_listen_connections, ec);
    }
    if (!ec) {
        acceptor.non_blocking(true, ec);
    }

    if (ec) {
        state_.setStatus(std::string(label) + " bind: " + ec.message());
        boost::system::error_code ignored;
        acceptor.close(ignored);
        return false;
    }
    return true;
}

bool BridgeServer::pollAccept(tcp::acceptor& acceptor, tcp::socket& socket)
{
    while (!stopping_) {
        boost::system::error_code ec;
        acceptor.accept(socket, ec);
        if (!ec) {
            socket.non_blocking(false, ec);
            return true;
        }

        if (ec != asio::error::would_block && ec != asio::error::try_again) {
            logWarn("Accept failed: %s", ec.message().c_str());
        }
        waitUnlessStopping(options_.acceptPoll);
    }
    return false;
}

bool BridgeServer::waitUnlessStopping(std::chrono::milliseconds duration)
{
    std::unique_lock<std::mutex> lock(stopMutex_);
    return !stopCondition_.wait_for(lock, duration, [this] { return stopping_.load(); });
}

void BridgeServer::httpLoop()
{
    while (true) {
        tcp::socket socket(ioContext_);
        if (!pollAccept(httpAcceptor_, socket)) {
            break;
        }
        serveHttpClient(socket);
    }

    boost::system::error_code ignored;
    httpAcceptor_.close(ignored);
}

void BridgeServer::serveHttpClient(tcp::socket& socket)
{
    // The request content does not matter; read what is there and discard it
    pollfd pfd{};
    pfd.fd = socket.native_handle();
    pfd.events = POLLIN;
    int ready = ::poll(&pfd, 1, static_cast<int>(options_.httpReadTimeout.count()));

    boost::system::error_code ec;
    if (ready > 0) {
        std::array<char, 2048> request;
        socket.read_some(asio::buffer(request), ec);
        if (ec) {
            logDebug("HTTP request read failed: %s", ec.message().c_str());
        }
    }

    asio::write(socket, asio::buffer(httpResponse_), ec);
    if (ec) {
        logDebug("HTTP response write failed: %s", ec.message().c_str());
    }

    boost::system::error_code ignored;
    socket.shutdown(tcp::socket::shutdown_both, ignored);
    socket.close(ignored);
}

void BridgeServer::setActiveSocket(int nativeHandle)
{
    std::lock_guard<std::mutex> lock(activeMutex_);
    activeSocket_ = nativeHandle;
    if (stopping_) {
        ::shutdown(activeSocket_, SHUT_RDWR);
    }
}

void BridgeServer::clearActiveSocket()
{
    std::lock_guard<std::mutex> lock(activeMutex_);
    activeSocket_ = -1;
}

} // namespace bridge
