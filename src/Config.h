#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstdlib>

namespace YAML {
class Node;
}

/**
 * What to do with the broadcast once the link recovers.
 */
struct ReturnBehavior {
    enum class Kind {
        PREVIOUS,  // Return to the scene that was live before the failover
        MANUAL,    // Leave the fallback scene up, operator switches by hand
        SCENE      // Switch to a fixed scene name
    };

    Kind kind = Kind::PREVIOUS;
    std::string scene;  // Only set for Kind::SCENE

    // "previous" and "manual" (case-insensitive) are keywords, anything else
    // is taken as a literal scene name
    static ReturnBehavior parse(const std::string& value);

    std::string toString() const;
};

struct WebhookTarget {
    std::string id;
    std::string url;
};

class Config {
public:
    // Load configuration from YAML file
    // Environment variables override YAML values if set
    bool loadFromFile(const std::string& filename);

    // Same as loadFromFile, from an in-memory YAML document
    bool loadFromString(const std::string& yaml);

    // Monitor behaviour
    bool isEnabled() const { return enabled_; }
    uint32_t getCheckIntervalSec() const { return check_interval_sec_; }
    uint32_t getTimeoutThresholdSec() const { return timeout_threshold_sec_; }
    const std::string& getFallbackScene() const { return fallback_scene_; }
    const ReturnBehavior& getReturnBehavior() const { return return_behavior_; }
    bool notificationsEnabled() const { return notifications_enabled_; }

    // Telemetry endpoint and thresholds
    const std::string& getStatsUrl() const { return stats_url_; }
    double getBitrateThresholdKbps() const { return bitrate_threshold_kbps_; }
    double getRttThresholdMs() const { return rtt_threshold_ms_; }
    double getDroppedThreshold() const { return dropped_threshold_; }

    // Outer surfaces
    const std::string& getControllerUrl() const { return controller_url_; }
    uint16_t getStatusPort() const { return status_port_; }
    uint32_t getStatusRefreshSec() const { return status_refresh_sec_; }
    const std::vector<WebhookTarget>& getWebhooks() const { return webhooks_; }
    const std::string& getLogLevel() const { return log_level_; }
    bool isDebug() const { return log_level_ == "DEBUG"; }

    // Start-time configuration problem, empty if monitoring can start.
    // Monitoring enabled without a telemetry endpoint or a fallback scene.
    std::string configError() const;

    // Print configuration
    void print() const;

private:
    bool loadFromNode(const YAML::Node& root);
    void applyEnvironment();

    // Helpers to get environment variables with default value
    static uint32_t getEnvUint32(const char* name, uint32_t default_value);
    static double getEnvDouble(const char* name, double default_value);
    static bool getEnvBool(const char* name, bool default_value);
    static std::string getEnvString(const char* name, const std::string& default_value);

    // Monitor settings
    bool enabled_ = false;
    uint32_t check_interval_sec_ = 15;
    uint32_t timeout_threshold_sec_ = 60;
    std::string fallback_scene_ = "BRB";
    ReturnBehavior return_behavior_;
    bool notifications_enabled_ = true;

    // Telemetry settings (defaults match the example config)
    std::string stats_url_;
    double bitrate_threshold_kbps_ = 1000;  // BITRATE_THRESHOLD_KBPS
    double rtt_threshold_ms_ = 2000;        // RTT_THRESHOLD_MS
    double dropped_threshold_ = 100;        // DROPPED_THRESHOLD

    // Controller, status and notification settings
    std::string controller_url_ = "http://controller:8089";
    uint16_t status_port_ = 8092;
    uint32_t status_refresh_sec_ = 60;
    std::vector<WebhookTarget> webhooks_;
    std::string log_level_ = "INFO";
};
