#include "bridge_page.hpp"
#include <cstdio>

namespace bridge {

namespace {

void replaceAll(std::string& text, const std::string& placeholder, const std::string& value)
{
    size_t pos = 0;
    while ((pos = text.find(placeholder, pos)) != std::string::npos) {
        text.replace(pos, placeholder.size(), value);
        pos += value.size();
    }
}

} // namespace

std::string formatHexId(uint16_t id)
{
    char buffer[8];
    snprintf(buffer, sizeof(buffer), "0x%04X", static_cast<unsigned int>(id));
    return buffer;
}

std::string renderBridgePage(const std::string& pageTemplate,
                             uint16_t wsPort,
                             uint16_t vendorId,
                             uint16_t productId)
{
    std::string page = pageTemplate;
    replaceAll(page, "__WS_PORT__", std::to_string(wsPort));
    replaceAll(page, "__VID__", formatHexId(vendorId));
    replaceAll(page, "__PID__", formatHexId(productId));
    return page;
}

std::string buildHttpResponse(const std::string& body)
{
    std::string response;
    response.reserve(body.size() + 128);
    response += "HTTP/1.1 200 OK\r\n";
    response += "Content-Type: text/html;charset=utf-8\r\n";
    response += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    response += "Connection: close\r\n";
    response += "\r\n";
    response += body;
    return response;
}

} // namespace bridge
