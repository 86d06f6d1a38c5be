#include <analog_keyboard.hpp>
#include <bridge_config.hpp>
#include <hidapi_device_probe.hpp>
#include <json_lines_telemetry_sink.hpp>
#include <keyboard_snapshot.hpp>
#include <xdg_browser_launcher.hpp>
#include <log.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <thread>

std::atomic<bool> running(true);

void signalHandler(int /*signum*/) {
    running = false;
}

int main(int argc, char** argv) {
    try {
        logInfo("kbhall - analog keyboard bridge");
        logInfo("===============================");

        platform::BridgeConfig config;
        if (argc > 1) {
            config.loadFromFile(argv[1]);
        } else {
            logInfo("No config file given, using defaults");
            logInfo("Usage: %s [config.json]", argv[0]);
        }
        logInfo("Target keyboard: %04x:%04x", config.vendorId, config.productId);

        auto probe = std::make_unique<linux::HidApiDeviceProbe>();

        logInfo("\nAttached HID devices:");
        auto devices = probe->listDevices();
        if (devices.empty()) {
            logInfo("  (none found)");
        } else {
            for (const auto& d : devices) {
                logInfo("  %04x:%04x %s %s", d.vendorId, d.productId,
                        d.path.c_str(), d.description.c_str());
            }
        }

        signal(SIGINT, signalHandler);
        signal(SIGTERM, signalHandler);

        platform::AnalogKeyboard kb(config,
                                    std::move(probe),
                                    std::make_unique<linux::XdgBrowserLauncher>());
        kb.start();

        linux::JsonLinesTelemetrySink<keyboard::KeyboardSnapshot> sink;
        keyboard::KeyboardSnapshot last;
        bool first = true;
        const auto interval = std::chrono::milliseconds(config.monitorIntervalMs);

        logInfo("\nStreaming key snapshots to stdout (Ctrl+C to stop)...");

        while (running) {
            keyboard::KeyboardSnapshot snapshot = keyboard::KeyboardSnapshot::capture(kb.state());
            if (first || snapshot != last) {
                sink.sendTelemetry(snapshot);
                last = snapshot;
                first = false;
            }
            std::this_thread::sleep_for(interval);
        }

        logInfo("\nShutting down...");
        kb.stop();
        return 0;

    } catch (const std::exception& e) {
        logError("Error: %s", e.what());
        return 1;
    }
}
