#pragma once

#include "Config.h"
#include "FailureDetector.h"
#include "MonitorState.h"
#include "NotificationSink.h"
#include "SceneSwitcher.h"
#include <memory>
#include <optional>

/**
 * FailoverController - turns detector edges into scene switches.
 *
 * Holds no monitor state of its own: every call takes the state being built
 * for this cycle and returns it with the controller's fields updated
 * (last_known_good_scene, fallback_engaged). MonitorLoop publishes the result.
 */
class FailoverController {
public:
    FailoverController(const Config& config,
                       std::shared_ptr<SceneSwitcher> scene_switcher,
                       std::shared_ptr<NotificationSink> notifier);

    // Prevent copying
    FailoverController(const FailoverController&) = delete;
    FailoverController& operator=(const FailoverController&) = delete;

    // Dispatch one cycle: the transition if any, otherwise the FAILED-phase
    // retry of an unconfirmed fallback switch
    MonitorState handle(const std::optional<Transition>& transition, MonitorState state);

    // Capture the live scene and switch to the fallback
    MonitorState enterFailed(MonitorState state);

    // Retry the fallback switch until it is confirmed
    MonitorState maintainFailed(MonitorState state);

    // Restore according to the configured return behavior
    MonitorState enterHealthy(MonitorState state);

private:
    bool switchToFallback(MonitorState& state);
    void notify(const std::string& message, Severity severity);

    const Config& config_;
    std::shared_ptr<SceneSwitcher> scene_switcher_;
    std::shared_ptr<NotificationSink> notifier_;
};
