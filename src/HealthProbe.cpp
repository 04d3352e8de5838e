#include "HealthProbe.h"
#include <nlohmann/json.hpp>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

// Thrown while walking the payload; converted to a "parse error" verdict
// before it can leave evaluate()
struct PayloadError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

const json& requireObject(const json& parent, const char* key, const std::string& path) {
    auto it = parent.find(key);
    if (it == parent.end()) {
        throw PayloadError("missing field " + path);
    }
    if (!it->is_object()) {
        throw PayloadError("field " + path + " is not an object");
    }
    return *it;
}

double requireNumber(const json& parent, const char* key, const std::string& path) {
    auto it = parent.find(key);
    if (it == parent.end()) {
        throw PayloadError("missing field " + path);
    }
    if (!it->is_number()) {
        throw PayloadError("field " + path + " is not a number");
    }
    return it->get<double>();
}

EncoderHealth offline(const std::string& error) {
    EncoderHealth health;
    health.online = false;
    health.error = error;
    return health;
}

}  // namespace

HealthProbe::HealthProbe(const Config& config, std::shared_ptr<HttpClient> http_client)
    : config_(config),
      fetcher_([http_client](const std::string& url, long timeout_sec) {
          return http_client->get(url, timeout_sec);
      }) {
}

HealthProbe::HealthProbe(const Config& config, Fetcher fetcher)
    : config_(config),
      fetcher_(std::move(fetcher)) {
}

EncoderHealth HealthProbe::checkHealth() const {
    return probe().health;
}

ProbeReport HealthProbe::probe() const {
    ProbeReport report;

    if (config_.getStatsUrl().empty()) {
        report.health = offline("no stats URL configured");
        return report;
    }

    HttpResult response;
    try {
        response = fetcher_(config_.getStatsUrl(), REQUEST_TIMEOUT_SEC);
    } catch (const std::exception& e) {
        // A fetcher must not take the monitor down with it
        std::cerr << "[HealthProbe] Fetch threw: " << e.what() << std::endl;
        report.health = offline(std::string("connection error: ") + e.what());
        return report;
    }

    report.transport_ok = response.transport_ok;
    report.http_status = response.status;
    report.raw_body = response.body;
    report.health = evaluate(response, config_);

    if (config_.isDebug()) {
        std::cout << "[HealthProbe] online=" << (report.health.online ? "true" : "false")
                  << " bitrate=" << report.health.bitrate_kbps
                  << " rtt=" << report.health.rtt_ms
                  << " dropped=" << report.health.dropped_packets
                  << (report.health.error ? " error=" + *report.health.error : "") << std::endl;
    }

    return report;
}

EncoderHealth HealthProbe::evaluate(const HttpResult& response, const Config& config) {
    if (!response.transport_ok) {
        if (response.timed_out) {
            return offline("timeout");
        }
        return offline("connection error: " + (response.error.empty() ? std::string("unknown") : response.error));
    }

    if (response.status < 200 || response.status >= 300) {
        return offline("HTTP " + std::to_string(response.status));
    }

    EncoderHealth health;
    try {
        json data = json::parse(response.body);
        if (!data.is_object()) {
            throw PayloadError("top level is not an object");
        }

        const json& publishers = requireObject(data, "publishers", "publishers");
        const json& live = requireObject(publishers, "live", "publishers.live");

        auto connected = live.find("connected");
        if (connected == live.end()) {
            throw PayloadError("missing field publishers.live.connected");
        }
        if (!connected->is_boolean()) {
            throw PayloadError("field publishers.live.connected is not a boolean");
        }

        health.connected = connected->get<bool>();
        if (!health.connected) {
            // Thresholds are meaningless without a publisher
            health.online = false;
            health.error = "publisher not connected";
            return health;
        }

        health.bitrate_kbps = requireNumber(live, "bitrate", "publishers.live.bitrate");
        health.rtt_ms = requireNumber(live, "rtt", "publishers.live.rtt");

        auto dropped = live.find("dropped_pkts");
        if (dropped == live.end()) {
            throw PayloadError("missing field publishers.live.dropped_pkts");
        }
        if (!dropped->is_number_integer()) {
            throw PayloadError("field publishers.live.dropped_pkts is not an integer");
        }
        // Counts past INT64_MAX saturate instead of wrapping negative
        if (dropped->is_number_unsigned() &&
            dropped->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            health.dropped_packets = std::numeric_limits<int64_t>::max();
        } else {
            health.dropped_packets = dropped->get<int64_t>();
        }

    } catch (const json::exception& e) {
        return offline(std::string("parse error: ") + e.what());
    } catch (const PayloadError& e) {
        return offline(std::string("parse error: ") + e.what());
    }

    health.bitrate_ok = health.bitrate_kbps >= config.getBitrateThresholdKbps();
    health.rtt_ok = health.rtt_ms <= config.getRttThresholdMs();
    health.dropped_ok = static_cast<double>(health.dropped_packets) <= config.getDroppedThreshold();
    health.online = health.bitrate_ok && health.rtt_ok && health.dropped_ok;

    if (!health.online) {
        std::ostringstream reason;
        const char* separator = "";
        if (!health.bitrate_ok) {
            reason << "bitrate " << health.bitrate_kbps << " kbps below "
                   << config.getBitrateThresholdKbps() << " kbps";
            separator = "; ";
        }
        if (!health.rtt_ok) {
            reason << separator << "rtt " << health.rtt_ms << " ms above "
                   << config.getRttThresholdMs() << " ms";
            separator = "; ";
        }
        if (!health.dropped_ok) {
            reason << separator << "dropped " << health.dropped_packets << " pkts above "
                   << config.getDroppedThreshold() << " pkts";
        }
        health.error = reason.str();
    }

    return health;
}
