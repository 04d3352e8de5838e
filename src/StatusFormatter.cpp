#include "StatusFormatter.h"
#include <nlohmann/json.hpp>
#include <ctime>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

std::string StatusFormatter::describeHealth(const EncoderHealth& health) {
    if (!health.online) {
        return "Offline: " + health.error.value_or("unknown cause");
    }

    std::ostringstream out;
    out << health.bitrate_kbps << " kbps • " << health.rtt_ms << "ms RTT • "
        << health.dropped_packets << " pkts dropped";
    return out.str();
}

std::string StatusFormatter::endpointHost(const std::string& url) {
    std::string rest = url;
    size_t scheme_end = rest.find("://");
    if (scheme_end != std::string::npos) {
        rest = rest.substr(scheme_end + 3);
    }
    size_t path_start = rest.find_first_of("/?#");
    if (path_start != std::string::npos) {
        rest = rest.substr(0, path_start);
    }
    // Drop credentials if any
    size_t at = rest.rfind('@');
    if (at != std::string::npos) {
        rest = rest.substr(at + 1);
    }
    return rest;
}

std::string StatusFormatter::formatTimestamp(std::chrono::system_clock::time_point tp) {
    auto ms_since_epoch = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    std::time_t time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm;
    gmtime_r(&time, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &tm);
    int millis = static_cast<int>(ms_since_epoch % 1000);
    if (millis < 0) {
        millis += 1000;
    }
    std::ostringstream oss;
    oss << buffer << "." << std::setfill('0') << std::setw(3) << millis << "Z";
    return oss.str();
}

std::string StatusFormatter::truncate(const std::string& text, size_t limit) {
    if (text.size() <= limit) {
        return text;
    }
    return text.substr(0, limit) + "...";
}

std::optional<long long> StatusFormatter::pendingSeconds(const MonitorState& state, MonitorTime now) {
    if (!state.pending_since) {
        return std::nullopt;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - *state.pending_since);
    return elapsed.count() < 0 ? 0 : elapsed.count();
}

std::string StatusFormatter::formatText(const MonitorStatus& status, const Config& config, MonitorTime now) {
    const MonitorState& state = status.state;
    std::ostringstream out;

    out << "Connection Monitor: " << (status.running ? "Active" : "Stopped") << "\n";
    if (!config.isEnabled()) {
        out << "Monitoring is disabled in config (monitor.enabled)\n";
    }

    out << "Fallback Scene: " << config.getFallbackScene()
        << " | Check Interval: " << config.getCheckIntervalSec() << "s"
        << " | Timeout: " << config.getTimeoutThresholdSec() << "s\n";
    out << "Thresholds: bitrate >= " << config.getBitrateThresholdKbps() << " kbps"
        << " | rtt <= " << config.getRttThresholdMs() << " ms"
        << " | dropped <= " << config.getDroppedThreshold() << " pkts\n";
    out << "Endpoint: "
        << (config.getStatsUrl().empty() ? std::string("not configured") : endpointHost(config.getStatsUrl()))
        << " | Return: " << config.getReturnBehavior().toString()
        << " | Notifications: " << (config.notificationsEnabled() ? "enabled" : "disabled") << "\n";

    if (!status.running) {
        return out.str();
    }

    out << "Phase: " << toString(state.phase);
    if (auto pending = pendingSeconds(state, now)) {
        out << " (failing for " << *pending << "s of " << config.getTimeoutThresholdSec() << "s)";
    }
    out << "\n";

    out << "Fallback Active: " << (status.fallback_active ? "yes" : "no");
    if (state.last_known_good_scene) {
        out << " | Return Scene: " << *state.last_known_good_scene;
    }
    out << "\n";

    if (state.last_checked) {
        out << "Encoder: " << describeHealth(state.last_health)
            << " (checked " << formatTimestamp(*state.last_checked) << ")\n";
    } else {
        out << "Encoder: not checked yet\n";
    }

    return out.str();
}

std::string StatusFormatter::formatJson(const MonitorStatus& status, const Config& config, MonitorTime now) {
    const MonitorState& state = status.state;
    const EncoderHealth& health = state.last_health;

    json health_json = {
        {"online", health.online},
        {"connected", health.connected},
        {"bitrate_kbps", health.bitrate_kbps},
        {"rtt_ms", health.rtt_ms},
        {"dropped_packets", health.dropped_packets},
        {"bitrate_ok", health.bitrate_ok},
        {"rtt_ok", health.rtt_ok},
        {"dropped_ok", health.dropped_ok},
        {"error", health.error ? json(*health.error) : json(nullptr)}
    };

    auto pending = pendingSeconds(state, now);

    json body = {
        {"enabled", config.isEnabled()},
        {"running", status.running},
        {"phase", toString(state.phase)},
        {"pending_for_sec", pending ? json(*pending) : json(nullptr)},
        {"fallback_scene", config.getFallbackScene()},
        {"fallback_active", status.fallback_active},
        {"last_known_good_scene", state.last_known_good_scene ? json(*state.last_known_good_scene) : json(nullptr)},
        {"return_behavior", config.getReturnBehavior().toString()},
        {"cycles", state.cycles},
        {"last_checked", state.last_checked ? json(formatTimestamp(*state.last_checked)) : json(nullptr)},
        {"health", health_json}
    };

    // Offline reasons can quote raw endpoint bytes
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string StatusFormatter::formatProbeText(const ProbeReport& report) {
    std::ostringstream out;

    if (report.transport_ok) {
        out << "HTTP Status: " << report.http_status << "\n";
    } else {
        out << "HTTP Status: no response\n";
    }
    out << "Verdict: " << (report.health.online ? "online" : "offline");
    if (report.health.error) {
        out << " (" << *report.health.error << ")";
    }
    out << "\n";

    if (report.health.connected) {
        out << "Parsed: connected=true bitrate=" << report.health.bitrate_kbps
            << " rtt=" << report.health.rtt_ms
            << " dropped_pkts=" << report.health.dropped_packets << "\n";
    }

    if (!report.raw_body.empty()) {
        out << "Raw Response:\n" << truncate(report.raw_body, RAW_BODY_LIMIT) << "\n";
    }

    return out.str();
}

std::string StatusFormatter::formatProbeJson(const ProbeReport& report) {
    const EncoderHealth& health = report.health;

    json body = {
        {"online", health.online},
        {"connected", health.connected},
        {"bitrate_kbps", health.bitrate_kbps},
        {"rtt_ms", health.rtt_ms},
        {"dropped_packets", health.dropped_packets},
        {"error", health.error ? json(*health.error) : json(nullptr)},
        {"http_status", report.transport_ok ? json(report.http_status) : json(nullptr)},
        {"raw_response", truncate(report.raw_body, RAW_BODY_LIMIT)}
    };

    // Raw bodies are arbitrary bytes; never fail on invalid UTF-8
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}
