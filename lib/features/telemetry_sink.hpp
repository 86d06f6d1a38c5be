#pragma once

namespace features {

/**
 * @brief Destination for periodic state snapshots
 *
 * Implementations decide the transport (stdout JSON Lines, file, socket).
 * Use NoTelemetrySink when snapshots are not wanted, so callers never need
 * a null check.
 *
 * @tparam TelemetryDataT Snapshot type
 */
template<typename TelemetryDataT>
class TelemetrySink {
public:
    virtual ~TelemetrySink() = default;

    /**
     * @brief Emit one snapshot
     */
    virtual void sendTelemetry(const TelemetryDataT& data) = 0;
};

/**
 * @brief Null object implementation - drops every snapshot
 */
template<typename TelemetryDataT>
class NoTelemetrySink : public TelemetrySink<TelemetryDataT> {
public:
    void sendTelemetry(const TelemetryDataT& /*data*/) override {
    }
};

} // namespace features
