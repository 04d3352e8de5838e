#include "FailoverController.h"
#include <iostream>

FailoverController::FailoverController(const Config& config,
                                       std::shared_ptr<SceneSwitcher> scene_switcher,
                                       std::shared_ptr<NotificationSink> notifier)
    : config_(config),
      scene_switcher_(std::move(scene_switcher)),
      notifier_(std::move(notifier)) {
}

MonitorState FailoverController::handle(const std::optional<Transition>& transition, MonitorState state) {
    if (transition) {
        if (*transition == Transition::ENTER_FAILED) {
            return enterFailed(std::move(state));
        }
        return enterHealthy(std::move(state));
    }

    if (state.phase == MonitorPhase::FAILED && !state.fallback_engaged) {
        return maintainFailed(std::move(state));
    }
    return state;
}

MonitorState FailoverController::enterFailed(MonitorState state) {
    const std::string& fallback = config_.getFallbackScene();

    std::optional<std::string> current = scene_switcher_->getCurrentScene();
    if (current && *current != fallback) {
        state.last_known_good_scene = *current;
        std::cout << "[FailoverController] Saved live scene '" << *current << "' before failover" << std::endl;
    } else if (!current) {
        std::cerr << "[FailoverController] Could not read current scene, nothing to restore later" << std::endl;
    }

    switchToFallback(state);
    return state;
}

MonitorState FailoverController::maintainFailed(MonitorState state) {
    const std::string& fallback = config_.getFallbackScene();

    // Someone else may have put the fallback up in the meantime
    std::optional<std::string> current = scene_switcher_->getCurrentScene();
    if (current && *current == fallback) {
        std::cout << "[FailoverController] Fallback scene '" << fallback << "' is already live" << std::endl;
        state.fallback_engaged = true;
        return state;
    }

    std::cout << "[FailoverController] Retrying switch to fallback scene '" << fallback << "'" << std::endl;
    switchToFallback(state);
    return state;
}

bool FailoverController::switchToFallback(MonitorState& state) {
    const std::string& fallback = config_.getFallbackScene();

    if (!scene_switcher_->switchScene(fallback)) {
        state.fallback_engaged = false;
        std::cerr << "[FailoverController] Failed to switch to fallback scene '" << fallback
                  << "', will retry next cycle" << std::endl;
        return false;
    }

    state.fallback_engaged = true;
    std::string reason = state.last_health.error.value_or("connection failed");
    std::cerr << "[FailoverController] Connection lost! Switched to " << fallback
              << ". Reason: " << reason << std::endl;
    notify("Connection lost! Switched to " + fallback + " scene. Reason: " + reason, Severity::WARNING);
    return true;
}

MonitorState FailoverController::enterHealthy(MonitorState state) {
    const ReturnBehavior& behavior = config_.getReturnBehavior();

    std::optional<std::string> target;
    switch (behavior.kind) {
        case ReturnBehavior::Kind::PREVIOUS:
            target = state.last_known_good_scene;
            break;
        case ReturnBehavior::Kind::MANUAL:
            // Nothing will ever restore it
            state.last_known_good_scene.reset();
            break;
        case ReturnBehavior::Kind::SCENE:
            target = behavior.scene;
            break;
    }

    if (!target) {
        std::cout << "[FailoverController] Connection restored! Manual scene control required." << std::endl;
        notify("Connection restored! Manual scene control required.", Severity::INFO);
        return state;
    }

    if (!scene_switcher_->switchScene(*target)) {
        // Not retried: the detector is already back to HEALTHY
        std::cerr << "[FailoverController] Connection restored but switch back to '" << *target
                  << "' failed" << std::endl;
        return state;
    }

    state.last_known_good_scene.reset();
    state.fallback_engaged = false;
    std::cout << "[FailoverController] Connection restored! Switched back to " << *target << std::endl;
    notify("Connection restored! Switched back to " + *target + " scene.", Severity::INFO);
    return state;
}

void FailoverController::notify(const std::string& message, Severity severity) {
    if (!config_.notificationsEnabled() || !notifier_) {
        return;
    }
    // Sink failures are logged only, the scene switch already happened
    try {
        notifier_->notify(message, severity);
    } catch (const std::exception& e) {
        std::cerr << "[FailoverController] Notification failed: " << e.what() << std::endl;
    }
}
