#ifndef BRIDGE_PAGE_HPP
#define BRIDGE_PAGE_HPP

#include <cstdint>
#include <string>

namespace bridge {

/**
 * @brief Fill the capture page template for one bridge
 * @param pageTemplate Template containing __WS_PORT__, __VID__ and __PID__
 * @param wsPort WebSocket listener port, rendered in decimal
 * @param vendorId Rendered as 0xHHHH
 * @param productId Rendered as 0xHHHH
 */
std::string renderBridgePage(const std::string& pageTemplate,
                             uint16_t wsPort,
                             uint16_t vendorId,
                             uint16_t productId);

/**
 * @brief The single response served for every HTTP request
 *
 * 200 OK, text/html, exact Content-Length, Connection: close.
 */
std::string buildHttpResponse(const std::string& body);

/**
 * @brief Format a 16-bit id as a 0x-prefixed 4-digit upper-case hex literal
 */
std::string formatHexId(uint16_t id);

} // namespace bridge

#endif // BRIDGE_PAGE_HPP
