#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

/**
 * Verdict produced by HealthProbe for one monitoring cycle.
 * Immutable once built.
 */
struct EncoderHealth {
    bool online = false;
    bool connected = false;
    double bitrate_kbps = 0.0;
    double rtt_ms = 0.0;
    int64_t dropped_packets = 0;

    // Per-threshold results (only meaningful when connected)
    bool bitrate_ok = false;
    bool rtt_ok = false;
    bool dropped_ok = false;

    // Concrete cause when online == false
    std::optional<std::string> error;
};

enum class MonitorPhase {
    HEALTHY,
    PENDING_FAILURE,
    FAILED
};

inline const char* toString(MonitorPhase phase) {
    switch (phase) {
        case MonitorPhase::HEALTHY:
            return "healthy";
        case MonitorPhase::PENDING_FAILURE:
            return "pending_failure";
        case MonitorPhase::FAILED:
            return "failed";
        default:
            return "unknown";
    }
}

// Debounce timing is monotonic; wall-clock time is for display only
using MonitorClock = std::chrono::steady_clock;
using MonitorTime = MonitorClock::time_point;

/**
 * Snapshot of the monitor. Owned by MonitorLoop and replaced wholesale each
 * cycle; never mutated after publication.
 *
 * pending_since is set iff phase == PENDING_FAILURE.
 * last_known_good_scene is the scene that was live before the fallback switch.
 */
struct MonitorState {
    MonitorPhase phase = MonitorPhase::HEALTHY;
    std::optional<MonitorTime> pending_since;
    std::optional<std::string> last_known_good_scene;
    EncoderHealth last_health;

    // Fallback switch confirmed in effect (switched by us, or observed)
    bool fallback_engaged = false;

    // Wall-clock time of the last completed cycle, for display
    std::optional<std::chrono::system_clock::time_point> last_checked;
    uint64_t cycles = 0;
};
