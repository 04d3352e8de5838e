#include "Config.h"
#include <yaml-cpp/yaml.h>
#include <iostream>
#include <fstream>
#include <algorithm>
#include <cctype>

static std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return value;
}

ReturnBehavior ReturnBehavior::parse(const std::string& value) {
    ReturnBehavior behavior;
    std::string lower = toLower(value);

    if (lower == "previous") {
        behavior.kind = Kind::PREVIOUS;
    } else if (lower == "manual") {
        behavior.kind = Kind::MANUAL;
    } else {
        behavior.kind = Kind::SCENE;
        behavior.scene = value;
    }
    return behavior;
}

std::string ReturnBehavior::toString() const {
    switch (kind) {
        case Kind::PREVIOUS:
            return "previous";
        case Kind::MANUAL:
            return "manual";
        case Kind::SCENE:
            return "scene:" + scene;
        default:
            return "unknown";
    }
}

// Helper to get environment variable as uint32_t with default value
uint32_t Config::getEnvUint32(const char* name, uint32_t default_value) {
    const char* env_value = std::getenv(name);
    if (env_value != nullptr && env_value[0] != '\0') {
        try {
            unsigned long val = std::stoul(env_value);
            return static_cast<uint32_t>(val);
        } catch (const std::exception& e) {
            std::cerr << "[Config] Warning: Invalid value for " << name
                      << " ('" << env_value << "'): " << e.what()
                      << " - using default " << default_value << std::endl;
        }
    }
    return default_value;
}

// Helper to get environment variable as double with default value
double Config::getEnvDouble(const char* name, double default_value) {
    const char* env_value = std::getenv(name);
    if (env_value != nullptr && env_value[0] != '\0') {
        try {
            return std::stod(env_value);
        } catch (const std::exception& e) {
            std::cerr << "[Config] Warning: Invalid value for " << name
                      << " ('" << env_value << "'): " << e.what()
                      << " - using default " << default_value << std::endl;
        }
    }
    return default_value;
}

bool Config::getEnvBool(const char* name, bool default_value) {
    const char* env_value = std::getenv(name);
    if (env_value == nullptr || env_value[0] == '\0') {
        return default_value;
    }

    std::string lower = toLower(env_value);
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
        return false;
    }

    std::cerr << "[Config] Warning: Invalid value for " << name
              << " ('" << env_value << "') - using default "
              << (default_value ? "true" : "false") << std::endl;
    return default_value;
}

std::string Config::getEnvString(const char* name, const std::string& default_value) {
    const char* env_value = std::getenv(name);
    if (env_value != nullptr && env_value[0] != '\0') {
        return env_value;
    }
    return default_value;
}

bool Config::loadFromFile(const std::string& filename) {
    // Check if file exists
    std::ifstream infile(filename);
    if (!infile.good()) {
        std::cerr << "[Config] Configuration file not found: " << filename << std::endl;
        return false;
    }

    try {
        return loadFromNode(YAML::LoadFile(filename));
    } catch (const YAML::Exception& e) {
        std::cerr << "[Config] YAML parsing error: " << e.what() << std::endl;
        return false;
    }
}

bool Config::loadFromString(const std::string& yaml) {
    try {
        return loadFromNode(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        std::cerr << "[Config] YAML parsing error: " << e.what() << std::endl;
        return false;
    }
}

bool Config::loadFromNode(const YAML::Node& root) {
    try {
        // An empty document is valid: every setting has a default
        if (root && !root.IsNull() && !root.IsMap()) {
            std::cerr << "[Config] Top level of configuration must be a mapping" << std::endl;
            return false;
        }

        // Signed reads so negative intervals are reported instead of wrapping
        int64_t check_interval = check_interval_sec_;
        int64_t timeout_threshold = timeout_threshold_sec_;

        const YAML::Node monitor = root["monitor"];
        if (monitor) {
            if (monitor["enabled"]) {
                enabled_ = monitor["enabled"].as<bool>();
            }
            if (monitor["check_interval"]) {
                check_interval = monitor["check_interval"].as<int64_t>();
            }
            if (monitor["timeout_threshold"]) {
                timeout_threshold = monitor["timeout_threshold"].as<int64_t>();
            }
            if (monitor["fallback_scene"]) {
                fallback_scene_ = monitor["fallback_scene"].as<std::string>();
            }
            if (monitor["return_behavior"]) {
                return_behavior_ = ReturnBehavior::parse(monitor["return_behavior"].as<std::string>());
            }
            if (monitor["notifications"]) {
                notifications_enabled_ = monitor["notifications"].as<bool>();
            }
        }

        if (check_interval <= 0) {
            std::cerr << "[Config] monitor.check_interval must be > 0 (got " << check_interval << ")" << std::endl;
            return false;
        }
        if (timeout_threshold <= 0) {
            std::cerr << "[Config] monitor.timeout_threshold must be > 0 (got " << timeout_threshold << ")" << std::endl;
            return false;
        }
        check_interval_sec_ = static_cast<uint32_t>(check_interval);
        timeout_threshold_sec_ = static_cast<uint32_t>(timeout_threshold);

        const YAML::Node telemetry = root["telemetry"];
        if (telemetry) {
            if (telemetry["stats_url"]) {
                stats_url_ = telemetry["stats_url"].as<std::string>();
            }
            if (telemetry["bitrate_threshold"]) {
                bitrate_threshold_kbps_ = telemetry["bitrate_threshold"].as<double>();
            }
            if (telemetry["rtt_threshold"]) {
                rtt_threshold_ms_ = telemetry["rtt_threshold"].as<double>();
            }
            if (telemetry["dropped_threshold"]) {
                dropped_threshold_ = telemetry["dropped_threshold"].as<double>();
            }
        }

        if (root["controller_url"]) {
            controller_url_ = root["controller_url"].as<std::string>();
        }
        if (root["status_port"]) {
            status_port_ = root["status_port"].as<uint16_t>();
        }
        if (root["status_refresh_sec"]) {
            status_refresh_sec_ = root["status_refresh_sec"].as<uint32_t>();
        }
        if (root["log_level"]) {
            log_level_ = root["log_level"].as<std::string>();
        }

        const YAML::Node webhooks = root["webhooks"];
        if (webhooks) {
            if (!webhooks.IsSequence()) {
                std::cerr << "[Config] webhooks must be a list of {id, url}" << std::endl;
                return false;
            }
            for (const auto& entry : webhooks) {
                if (!entry["id"] || !entry["url"]) {
                    std::cerr << "[Config] Webhook entry missing 'id' or 'url'" << std::endl;
                    return false;
                }
                webhooks_.push_back({entry["id"].as<std::string>(), entry["url"].as<std::string>()});
            }
        }

        // Environment variables override YAML values
        // Priority: env var > YAML > hardcoded default
        applyEnvironment();

        if (check_interval_sec_ == 0 || timeout_threshold_sec_ == 0) {
            std::cerr << "[Config] CHECK_INTERVAL_SEC and TIMEOUT_THRESHOLD_SEC must be > 0" << std::endl;
            return false;
        }

        std::transform(log_level_.begin(), log_level_.end(), log_level_.begin(),
                       [](unsigned char c) { return std::toupper(c); });

        return true;

    } catch (const YAML::Exception& e) {
        std::cerr << "[Config] Invalid configuration value: " << e.what() << std::endl;
        return false;
    }
}

void Config::applyEnvironment() {
    enabled_ = getEnvBool("MONITOR_ENABLED", enabled_);
    check_interval_sec_ = getEnvUint32("CHECK_INTERVAL_SEC", check_interval_sec_);
    timeout_threshold_sec_ = getEnvUint32("TIMEOUT_THRESHOLD_SEC", timeout_threshold_sec_);
    fallback_scene_ = getEnvString("FALLBACK_SCENE", fallback_scene_);
    notifications_enabled_ = getEnvBool("NOTIFICATIONS_ENABLED", notifications_enabled_);

    const char* return_env = std::getenv("RETURN_BEHAVIOR");
    if (return_env != nullptr && return_env[0] != '\0') {
        return_behavior_ = ReturnBehavior::parse(return_env);
    }

    stats_url_ = getEnvString("STATS_URL", stats_url_);
    bitrate_threshold_kbps_ = getEnvDouble("BITRATE_THRESHOLD_KBPS", bitrate_threshold_kbps_);
    rtt_threshold_ms_ = getEnvDouble("RTT_THRESHOLD_MS", rtt_threshold_ms_);
    dropped_threshold_ = getEnvDouble("DROPPED_THRESHOLD", dropped_threshold_);

    controller_url_ = getEnvString("CONTROLLER_URL", controller_url_);
    uint32_t port = getEnvUint32("STATUS_PORT", status_port_);
    if (port > 65535) {
        std::cerr << "[Config] Warning: STATUS_PORT out of range (" << port
                  << ") - using " << status_port_ << std::endl;
    } else {
        status_port_ = static_cast<uint16_t>(port);
    }
    status_refresh_sec_ = getEnvUint32("STATUS_REFRESH_SEC", status_refresh_sec_);
    log_level_ = getEnvString("LOG_LEVEL", log_level_);
}

std::string Config::configError() const {
    if (enabled_ && stats_url_.empty()) {
        return "monitoring is enabled but no telemetry stats_url is configured";
    }
    if (enabled_ && fallback_scene_.empty()) {
        return "monitoring is enabled but no fallback_scene is configured";
    }
    return "";
}

void Config::print() const {
    std::cout << "=== Configuration ===" << std::endl;
    std::cout << "Monitoring:         " << (enabled_ ? "enabled" : "disabled") << std::endl;
    std::cout << "Check Interval:     " << check_interval_sec_ << " s" << std::endl;
    std::cout << "Timeout Threshold:  " << timeout_threshold_sec_ << " s" << std::endl;
    std::cout << "Fallback Scene:     " << fallback_scene_ << std::endl;
    std::cout << "Return Behavior:    " << return_behavior_.toString() << std::endl;
    std::cout << "Notifications:      " << (notifications_enabled_ ? "enabled" : "disabled") << std::endl;
    std::cout << "--- Telemetry ---" << std::endl;
    std::cout << "Stats URL:          " << (stats_url_.empty() ? "(not set)" : stats_url_) << std::endl;
    std::cout << "Bitrate Threshold:  " << bitrate_threshold_kbps_ << " kbps" << std::endl;
    std::cout << "RTT Threshold:      " << rtt_threshold_ms_ << " ms" << std::endl;
    std::cout << "Dropped Threshold:  " << dropped_threshold_ << " pkts" << std::endl;
    std::cout << "--- Surfaces ---" << std::endl;
    std::cout << "Controller URL:     " << controller_url_ << std::endl;
    std::cout << "Status Port:        " << status_port_ << std::endl;
    std::cout << "Status Refresh:     " << status_refresh_sec_ << " s" << std::endl;
    std::cout << "Webhooks:           " << webhooks_.size() << std::endl;
    std::cout << "Log Level:          " << log_level_ << std::endl;
    std::cout << "=====================" << std::endl;
}
