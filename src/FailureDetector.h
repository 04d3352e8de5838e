#pragma once

#include "MonitorState.h"
#include <chrono>
#include <optional>

/**
 * Edge produced by the detector when the debounced link state changes.
 */
enum class Transition {
    ENTER_FAILED,
    ENTER_HEALTHY
};

inline const char* toString(Transition transition) {
    return transition == Transition::ENTER_FAILED ? "enter_failed" : "enter_healthy";
}

/**
 * FailureDetector - debounced link-down / link-up state machine
 *
 *   HEALTHY         + offline                     -> PENDING_FAILURE (pending_since = now)
 *   PENDING_FAILURE + online                      -> HEALTHY
 *   PENDING_FAILURE + offline, elapsed < timeout  -> PENDING_FAILURE
 *   PENDING_FAILURE + offline, elapsed >= timeout -> FAILED          (ENTER_FAILED)
 *   FAILED          + online                      -> HEALTHY         (ENTER_HEALTHY)
 *   FAILED          + offline                     -> FAILED
 *
 * Entry into FAILED is debounced; recovery is not.
 */
class FailureDetector {
public:
    struct Step {
        MonitorPhase phase = MonitorPhase::HEALTHY;
        std::optional<MonitorTime> pending_since;
        std::optional<Transition> transition;
    };

    explicit FailureDetector(std::chrono::seconds timeout_threshold);

    // Pure: computes the next phase from the current one, never mutates
    Step advance(MonitorPhase phase,
                 const std::optional<MonitorTime>& pending_since,
                 const EncoderHealth& health,
                 MonitorTime now) const;

private:
    std::chrono::seconds timeout_threshold_;
};
