#include "FailureDetector.h"
#include <iostream>

FailureDetector::FailureDetector(std::chrono::seconds timeout_threshold)
    : timeout_threshold_(timeout_threshold) {
}

FailureDetector::Step FailureDetector::advance(MonitorPhase phase,
                                               const std::optional<MonitorTime>& pending_since,
                                               const EncoderHealth& health,
                                               MonitorTime now) const {
    Step step;

    switch (phase) {
        case MonitorPhase::HEALTHY:
            if (health.online) {
                step.phase = MonitorPhase::HEALTHY;
            } else {
                step.phase = MonitorPhase::PENDING_FAILURE;
                step.pending_since = now;
                std::cout << "[FailureDetector] HEALTHY → PENDING_FAILURE ("
                          << health.error.value_or("offline") << ")" << std::endl;
            }
            break;

        case MonitorPhase::PENDING_FAILURE: {
            if (health.online) {
                step.phase = MonitorPhase::HEALTHY;
                std::cout << "[FailureDetector] PENDING_FAILURE → HEALTHY (link recovered before timeout)" << std::endl;
                break;
            }

            // pending_since is always set in this phase; treat a missing one
            // as "failure started now" rather than failing over immediately
            MonitorTime since = pending_since.value_or(now);
            auto elapsed = now - since;

            if (elapsed >= timeout_threshold_) {
                step.phase = MonitorPhase::FAILED;
                step.transition = Transition::ENTER_FAILED;
                std::cout << "[FailureDetector] PENDING_FAILURE → FAILED (offline for "
                          << std::chrono::duration_cast<std::chrono::seconds>(elapsed).count()
                          << "s, threshold=" << timeout_threshold_.count() << "s)" << std::endl;
            } else {
                step.phase = MonitorPhase::PENDING_FAILURE;
                step.pending_since = since;
            }
            break;
        }

        case MonitorPhase::FAILED:
            if (health.online) {
                step.phase = MonitorPhase::HEALTHY;
                step.transition = Transition::ENTER_HEALTHY;
                std::cout << "[FailureDetector] FAILED → HEALTHY" << std::endl;
            } else {
                step.phase = MonitorPhase::FAILED;
            }
            break;
    }

    return step;
}
