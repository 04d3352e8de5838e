#pragma once

#include "Config.h"
#include "HttpClient.h"
#include "MonitorState.h"
#include <functional>
#include <memory>
#include <string>

/**
 * Verdict plus the raw endpoint exchange, for troubleshooting.
 */
struct ProbeReport {
    EncoderHealth health;
    bool transport_ok = false;
    long http_status = 0;
    std::string raw_body;
};

/**
 * HealthProbe - one telemetry request per call, reduced to a verdict.
 *
 * Expects the stats endpoint to answer
 *   {"publishers":{"live":{"connected":bool,"bitrate":n,"rtt":n,"dropped_pkts":n}}}
 *
 * checkHealth() is total: every transport or protocol failure becomes an
 * offline EncoderHealth with error set ("timeout", "HTTP 503",
 * "parse error: ...", "publisher not connected").
 */
class HealthProbe {
public:
    using Fetcher = std::function<HttpResult(const std::string& url, long timeout_sec)>;

    static constexpr long REQUEST_TIMEOUT_SEC = 10;

    // Fetches through the given HTTP client
    HealthProbe(const Config& config, std::shared_ptr<HttpClient> http_client);

    // Fetches through an arbitrary function (used by tests)
    HealthProbe(const Config& config, Fetcher fetcher);

    EncoderHealth checkHealth() const;

    ProbeReport probe() const;

    // Reduce a fetched response to a verdict against the configured thresholds
    static EncoderHealth evaluate(const HttpResult& response, const Config& config);

private:
    const Config& config_;
    Fetcher fetcher_;
};
