#pragma once

#include <telemetry_sink.hpp>
#include <nlohmann/json.hpp>
#include <cstdio>
#include <mutex>
#include <string>

namespace linux {

/**
 * @brief Writes each snapshot as one JSON object per line
 *
 * Requires a to_json() overload for the data type. Lines are flushed
 * immediately so a reading pipe sees every snapshot as it happens.
 *
 * @tparam TelemetryDataT Type of telemetry data (must have to_json function)
 */
template<typename TelemetryDataT>
class JsonLinesTelemetrySink : public features::TelemetrySink<TelemetryDataT> {
public:
    explicit JsonLinesTelemetrySink(FILE* out = stdout)
        : out_(out) {}

    JsonLinesTelemetrySink(const JsonLinesTelemetrySink&) = delete;
    JsonLinesTelemetrySink& operator=(const JsonLinesTelemetrySink&) = delete;

    void sendTelemetry(const TelemetryDataT& data) override {
        nlohmann::json j = data;
        std::string line = j.dump();

        std::lock_guard<std::mutex> lock(mutex_);
        fprintf(out_, "%s\n", line.c_str());
        fflush(out_);
    }

private:
    FILE* out_;
    std::mutex mutex_;
};

} // namespace linux
