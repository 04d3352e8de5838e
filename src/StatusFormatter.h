#pragma once

#include "Config.h"
#include "HealthProbe.h"
#include "MonitorLoop.h"
#include "MonitorState.h"
#include <chrono>
#include <optional>
#include <string>

/**
 * Renders monitor status and probe diagnostics as plain text panels and JSON.
 */
class StatusFormatter {
public:
    // Raw endpoint responses are cut to this length in diagnostics
    static constexpr size_t RAW_BODY_LIMIT = 1500;

    static std::string formatText(const MonitorStatus& status, const Config& config, MonitorTime now);
    static std::string formatJson(const MonitorStatus& status, const Config& config, MonitorTime now);

    static std::string formatProbeText(const ProbeReport& report);
    static std::string formatProbeJson(const ProbeReport& report);

    // "kbps • ms RTT • pkts dropped" summary, or the offline reason
    static std::string describeHealth(const EncoderHealth& health);

    // Host part of a URL ("https://cloud.example/stats/x" -> "cloud.example")
    static std::string endpointHost(const std::string& url);

    // UTC ISO-8601 with milliseconds
    static std::string formatTimestamp(std::chrono::system_clock::time_point tp);

    static std::string truncate(const std::string& text, size_t limit);

private:
    static std::optional<long long> pendingSeconds(const MonitorState& state, MonitorTime now);
};
