#include <unity.h>
#include <bridge_page.hpp>
#include <bridge_page_template.hpp>
#include <string>

void setUp(void) {
}

void tearDown(void) {
}

static std::string headerValue(const std::string& response, const std::string& name) {
    size_t start = response.find(name + ": ");
    if (start == std::string::npos) {
        return "";
    }
    start += name.size() + 2;
    size_t end = response.find("\r\n", start);
    return response.substr(start, end - start);
}

void test_formatHexId_shouldPadToFourUpperCaseDigits(void) {
    TEST_ASSERT_EQUAL_STRING("0x41E4", bridge::formatHexId(0x41e4).c_str());
    TEST_ASSERT_EQUAL_STRING("0x000A", bridge::formatHexId(0x000a).c_str());
    TEST_ASSERT_EQUAL_STRING("0xFFFF", bridge::formatHexId(0xffff).c_str());
}

void test_render_shouldSubstituteEveryPlaceholder(void) {
    std::string tpl = "ws://127.0.0.1:__WS_PORT__/ {vendorId: __VID__, productId: __PID__} __WS_PORT__";

    std::string page = bridge::renderBridgePage(tpl, 51234, 0x41e4, 0x2103);

    TEST_ASSERT_EQUAL_STRING("ws://127.0.0.1:51234/ {vendorId: 0x41E4, productId: 0x2103} 51234", page.c_str());
}

void test_render_embeddedTemplate_shouldLeaveNoPlaceholders(void) {
    std::string page = bridge::renderBridgePage(bridge::BRIDGE_PAGE_TEMPLATE, 40000, 0x1234, 0x5678);

    TEST_ASSERT_TRUE(page.find("__WS_PORT__") == std::string::npos);
    TEST_ASSERT_TRUE(page.find("__VID__") == std::string::npos);
    TEST_ASSERT_TRUE(page.find("__PID__") == std::string::npos);
    TEST_ASSERT_TRUE(page.find("ws://127.0.0.1:40000") != std::string::npos);
    TEST_ASSERT_TRUE(page.find("vendorId: 0x1234") != std::string::npos);
    TEST_ASSERT_TRUE(page.find("productId: 0x5678") != std::string::npos);
}

void test_httpResponse_shouldCarryExactContentLength(void) {
    std::string body = "<html>\xC3\xA9</html>"; // multi-byte UTF-8 counts as bytes

    std::string response = bridge::buildHttpResponse(body);

    TEST_ASSERT_EQUAL_INT(0, response.find("HTTP/1.1 200 OK\r\n"));
    TEST_ASSERT_EQUAL_STRING("text/html;charset=utf-8", headerValue(response, "Content-Type").c_str());
    TEST_ASSERT_EQUAL_STRING(std::to_string(body.size()).c_str(), headerValue(response, "Content-Length").c_str());
    TEST_ASSERT_EQUAL_STRING("close", headerValue(response, "Connection").c_str());

    size_t bodyStart = response.find("\r\n\r\n");
    TEST_ASSERT_TRUE(bodyStart != std::string::npos);
    TEST_ASSERT_EQUAL_STRING(body.c_str(), response.substr(bodyStart + 4).c_str());
}

int RUN_UNITY_TESTS() {
    UNITY_BEGIN();
    RUN_TEST(test_formatHexId_shouldPadToFourUpperCaseDigits);
    RUN_TEST(test_render_shouldSubstituteEveryPlaceholder);
    RUN_TEST(test_render_embeddedTemplate_shouldLeaveNoPlaceholders);
    RUN_TEST(test_httpResponse_shouldCarryExactContentLength);
    return UNITY_END();
}

#ifdef PLATFORM_NATIVE
int main(int argc, char **argv) {
    return RUN_UNITY_TESTS();
}
#endif
