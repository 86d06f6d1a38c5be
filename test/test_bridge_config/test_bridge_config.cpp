#include <unity.h>
#include <bridge_config.hpp>
#include <nlohmann/json.hpp>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unistd.h>

using platform::BridgeConfig;

static std::string configPath;

void setUp(void) {
    configPath = "/tmp/kbhall_test_config_" + std::to_string(getpid()) + ".json";
}

void tearDown(void) {
    std::remove(configPath.c_str());
}

static void writeConfig(const std::string& content) {
    std::ofstream out(configPath);
    out << content;
}

void test_defaults_shouldMatchKeyboard(void) {
    BridgeConfig config;

    TEST_ASSERT_EQUAL_HEX16(0x41E4, config.vendorId);
    TEST_ASSERT_EQUAL_HEX16(0x2103, config.productId);
    TEST_ASSERT_EQUAL_UINT32(2000, config.searchBackoffMs);
    TEST_ASSERT_EQUAL_UINT32(2000, config.bridgeRetryDelayMs);
    TEST_ASSERT_EQUAL_UINT32(500, config.reconnectPauseMs);
    TEST_ASSERT_EQUAL_UINT32(100, config.acceptPollMs);
    TEST_ASSERT_EQUAL_UINT32(2000, config.httpReadTimeoutMs);
    TEST_ASSERT_TRUE(config.openBrowser);
    TEST_ASSERT_EQUAL_UINT32(50, config.monitorIntervalMs);
}

void test_parseHidId_shouldAcceptNumbersAndHexStrings(void) {
    TEST_ASSERT_EQUAL_HEX16(0x41E4, platform::parseHidId(nlohmann::json(16868)));
    TEST_ASSERT_EQUAL_HEX16(0x41E4, platform::parseHidId(nlohmann::json("0x41E4")));
    TEST_ASSERT_EQUAL_HEX16(0x2103, platform::parseHidId(nlohmann::json("0x2103")));
    TEST_ASSERT_EQUAL_HEX16(0xFFFF, platform::parseHidId(nlohmann::json("0xffff")));
}

static bool rejects(const nlohmann::json& value) {
    try {
        platform::parseHidId(value);
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

void test_parseHidId_shouldRejectInvalidIds(void) {
    TEST_ASSERT_TRUE(rejects(nlohmann::json(65536)));
    TEST_ASSERT_TRUE(rejects(nlohmann::json("0x10000")));
    TEST_ASSERT_TRUE(rejects(nlohmann::json("0x41E4 ")));
    TEST_ASSERT_TRUE(rejects(nlohmann::json("keyboard")));
    TEST_ASSERT_TRUE(rejects(nlohmann::json(-1)));
    TEST_ASSERT_TRUE(rejects(nlohmann::json(true)));
}

void test_load_partialFile_shouldOverrideOnlyGivenKeys(void) {
    writeConfig(R"({"vendor_id": "0x1234", "product_id": 22136, "open_browser": false, "accept_poll_ms": 25})");
    BridgeConfig config;

    TEST_ASSERT_TRUE(config.loadFromFile(configPath));

    TEST_ASSERT_EQUAL_HEX16(0x1234, config.vendorId);
    TEST_ASSERT_EQUAL_HEX16(0x5678, config.productId);
    TEST_ASSERT_FALSE(config.openBrowser);
    TEST_ASSERT_EQUAL_UINT32(25, config.acceptPollMs);
    TEST_ASSERT_EQUAL_UINT32(2000, config.searchBackoffMs);
    TEST_ASSERT_EQUAL_UINT32(500, config.reconnectPauseMs);
}

void test_load_missingFile_shouldKeepDefaults(void) {
    BridgeConfig config;

    TEST_ASSERT_FALSE(config.loadFromFile("/nonexistent/kbhall.json"));

    TEST_ASSERT_EQUAL_HEX16(0x41E4, config.vendorId);
}

void test_load_malformedJson_shouldKeepCurrentValues(void) {
    writeConfig("{\"vendor_id\": \"0x1234\", ");
    BridgeConfig config;
    config.monitorIntervalMs = 75;

    TEST_ASSERT_FALSE(config.loadFromFile(configPath));

    TEST_ASSERT_EQUAL_HEX16(0x41E4, config.vendorId);
    TEST_ASSERT_EQUAL_UINT32(75, config.monitorIntervalMs);
}

void test_load_invalidIdAfterValidKeys_shouldApplyNothing(void) {
    writeConfig(R"({"vendor_id": "0x1234", "product_id": "0x12345", "search_backoff_ms": 10})");
    BridgeConfig config;

    TEST_ASSERT_FALSE(config.loadFromFile(configPath));

    TEST_ASSERT_EQUAL_HEX16(0x41E4, config.vendorId);
    TEST_ASSERT_EQUAL_UINT32(2000, config.searchBackoffMs);
}

void test_load_nonObject_shouldBeRejected(void) {
    writeConfig("[1, 2, 3]");
    BridgeConfig config;

    TEST_ASSERT_FALSE(config.loadFromFile(configPath));
}

void test_toJson_shouldWriteHexIdsAndAllKeys(void) {
    BridgeConfig config;
    config.vendorId = 0x00AB;
    config.httpReadTimeoutMs = 1500;

    nlohmann::json j = config;

    TEST_ASSERT_EQUAL_STRING("0x00AB", j["vendor_id"].get<std::string>().c_str());
    TEST_ASSERT_EQUAL_STRING("0x2103", j["product_id"].get<std::string>().c_str());
    TEST_ASSERT_EQUAL_UINT32(1500, j["http_read_timeout_ms"].get<uint32_t>());
    TEST_ASSERT_EQUAL_INT(9, j.size());

    BridgeConfig reloaded;
    platform::from_json(j, reloaded);
    TEST_ASSERT_EQUAL_HEX16(0x00AB, reloaded.vendorId);
    TEST_ASSERT_EQUAL_UINT32(1500, reloaded.httpReadTimeoutMs);
}

int RUN_UNITY_TESTS() {
    UNITY_BEGIN();
    RUN_TEST(test_defaults_shouldMatchKeyboard);
    RUN_TEST(test_parseHidId_shouldAcceptNumbersAndHexStrings);
    RUN_TEST(test_parseHidId_shouldRejectInvalidIds);
    RUN_TEST(test_load_partialFile_shouldOverrideOnlyGivenKeys);
    RUN_TEST(test_load_missingFile_shouldKeepDefaults);
    RUN_TEST(test_load_malformedJson_shouldKeepCurrentValues);
    RUN_TEST(test_load_invalidIdAfterValidKeys_shouldApplyNothing);
    RUN_TEST(test_load_nonObject_shouldBeRejected);
    RUN_TEST(test_toJson_shouldWriteHexIdsAndAllKeys);
    return UNITY_END();
}

#ifdef PLATFORM_NATIVE
int main(int argc, char **argv) {
    return RUN_UNITY_TESTS();
}
#endif
