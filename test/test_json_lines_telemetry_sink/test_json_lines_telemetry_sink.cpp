#include <unity.h>
#include <json_lines_telemetry_sink.hpp>
#include <keyboard_snapshot.hpp>
#include <analog_keyboard_state.hpp>
#include <nlohmann/json.hpp>
#include <cstdio>
#include <string>
#include <vector>

using keyboard::AnalogKeyboardState;
using keyboard::KeyboardSnapshot;

static FILE* out = nullptr;

void setUp(void) {
    out = tmpfile();
}

void tearDown(void) {
    if (out != nullptr) {
        fclose(out);
        out = nullptr;
    }
}

static std::vector<std::string> readLines(FILE* file) {
    std::vector<std::string> lines;
    rewind(file);
    std::string current;
    int c;
    while ((c = fgetc(file)) != EOF) {
        if (c == '\n') {
            lines.push_back(current);
            current.clear();
        } else {
            current.push_back(static_cast<char>(c));
        }
    }
    if (!current.empty()) {
        lines.push_back(current);
    }
    return lines;
}

void test_sendTelemetry_shouldWriteOneObjectPerLine(void) {
    TEST_ASSERT_NOT_NULL(out);
    linux::JsonLinesTelemetrySink<KeyboardSnapshot> sink(out);
    AnalogKeyboardState state(0, 0);

    sink.sendTelemetry(KeyboardSnapshot::capture(state));
    state.setValue(0x04, 0.5f);
    state.setActive(true);
    sink.sendTelemetry(KeyboardSnapshot::capture(state));

    std::vector<std::string> lines = readLines(out);
    TEST_ASSERT_EQUAL_INT(2, lines.size());

    nlohmann::json first = nlohmann::json::parse(lines[0]);
    TEST_ASSERT_FALSE(first["active"].get<bool>());
    TEST_ASSERT_TRUE(first["keys"].empty());

    nlohmann::json second = nlohmann::json::parse(lines[1]);
    TEST_ASSERT_TRUE(second["active"].get<bool>());
    TEST_ASSERT_EQUAL_INT(4, second["keys"][0]["code"].get<int>());
}

void test_noTelemetrySink_shouldAcceptSnapshots(void) {
    features::NoTelemetrySink<KeyboardSnapshot> sink;
    features::TelemetrySink<KeyboardSnapshot>& base = sink;
    AnalogKeyboardState state(0, 0);

    base.sendTelemetry(KeyboardSnapshot::capture(state));
}

int RUN_UNITY_TESTS() {
    UNITY_BEGIN();
    RUN_TEST(test_sendTelemetry_shouldWriteOneObjectPerLine);
    RUN_TEST(test_noTelemetrySink_shouldAcceptSnapshots);
    return UNITY_END();
}

#ifdef PLATFORM_NATIVE
int main(int argc, char **argv) {
    return RUN_UNITY_TESTS();
}
#endif
