#include "FailoverController.h"
#include "FakeCollaborators.h"
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>

namespace {

class ThrowingNotificationSink : public NotificationSink {
public:
    void notify(const std::string&, Severity) override { throw std::runtime_error("sink down"); }
};

}  // namespace

class FailoverControllerTest : public ::testing::Test {
protected:
    void build(const std::string& return_behavior = "previous") {
        config_ = loadConfig(scenarioYaml(return_behavior));
        controller_ = std::make_unique<FailoverController>(config_, switcher_, notifier_);
    }

    MonitorState failedState() const {
        MonitorState state;
        state.phase = MonitorPhase::FAILED;
        state.last_health = offlineVerdict("HTTP 503");
        return state;
    }

    MonitorState recoveredState(const MonitorState& failed) const {
        MonitorState state = failed;
        state.phase = MonitorPhase::HEALTHY;
        state.last_health = healthyVerdict();
        return state;
    }

    Config config_;
    std::shared_ptr<FakeSceneSwitcher> switcher_ = std::make_shared<FakeSceneSwitcher>("Gameplay");
    std::shared_ptr<RecordingNotificationSink> notifier_ = std::make_shared<RecordingNotificationSink>();
    std::unique_ptr<FailoverController> controller_;
};

TEST_F(FailoverControllerTest, EnterFailedCapturesSceneAndSwitches) {
    build();

    MonitorState state = controller_->handle(Transition::ENTER_FAILED, failedState());

    EXPECT_EQ(state.last_known_good_scene, std::optional<std::string>("Gameplay"));
    EXPECT_TRUE(state.fallback_engaged);
    EXPECT_EQ(switcher_->switchCalls(), std::vector<std::string>{"BRB"});

    auto entries = notifier_->entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].severity, Severity::WARNING);
    EXPECT_NE(entries[0].message.find("HTTP 503"), std::string::npos);
    EXPECT_NE(entries[0].message.find("BRB"), std::string::npos);
}

TEST_F(FailoverControllerTest, AlreadyOnFallbackIsNotCaptured) {
    build();
    switcher_->setCurrentScene(std::string("BRB"));

    MonitorState state = controller_->enterFailed(failedState());

    EXPECT_FALSE(state.last_known_good_scene.has_value());
    EXPECT_EQ(switcher_->switchCountTo("BRB"), 1u);
}

TEST_F(FailoverControllerTest, UnknownCurrentSceneStillSwitches) {
    build();
    switcher_->setCurrentScene(std::nullopt);

    MonitorState state = controller_->enterFailed(failedState());

    EXPECT_FALSE(state.last_known_good_scene.has_value());
    EXPECT_TRUE(state.fallback_engaged);
    EXPECT_EQ(switcher_->switchCountTo("BRB"), 1u);
}

TEST_F(FailoverControllerTest, FailedSwitchIsLoggedOnlyAndRetriedNextCycle) {
    build();
    switcher_->failNextSwitches(1);

    MonitorState state = controller_->handle(Transition::ENTER_FAILED, failedState());
    EXPECT_FALSE(state.fallback_engaged);
    EXPECT_EQ(state.last_known_good_scene, std::optional<std::string>("Gameplay"));
    EXPECT_TRUE(notifier_->entries().empty());

    // Next unhealthy cycle in FAILED retries without recapturing
    state = controller_->handle(std::nullopt, state);
    EXPECT_TRUE(state.fallback_engaged);
    EXPECT_EQ(state.last_known_good_scene, std::optional<std::string>("Gameplay"));
    EXPECT_EQ(switcher_->switchCountTo("BRB"), 2u);
    EXPECT_EQ(notifier_->entries().size(), 1u);
}

TEST_F(FailoverControllerTest, NoFurtherSwitchesOnceFallbackConfirmed) {
    build();

    MonitorState state = controller_->handle(Transition::ENTER_FAILED, failedState());
    for (int i = 0; i < 10; ++i) {
        state = controller_->handle(std::nullopt, state);
    }

    EXPECT_EQ(switcher_->switchCount(), 1u);
}

TEST_F(FailoverControllerTest, RetryStopsWhenFallbackWentLiveElsewhere) {
    build();
    switcher_->failNextSwitches(1);

    MonitorState state = controller_->handle(Transition::ENTER_FAILED, failedState());
    ASSERT_FALSE(state.fallback_engaged);

    // Operator put BRB up by hand
    switcher_->setCurrentScene(std::string("BRB"));
    state = controller_->handle(std::nullopt, state);

    EXPECT_TRUE(state.fallback_engaged);
    EXPECT_EQ(switcher_->switchCount(), 1u);
}

TEST_F(FailoverControllerTest, PreviousBehaviorRestoresCapturedScene) {
    build("previous");

    MonitorState failed = controller_->handle(Transition::ENTER_FAILED, failedState());
    MonitorState state = controller_->handle(Transition::ENTER_HEALTHY, recoveredState(failed));

    EXPECT_EQ(switcher_->switchCountTo("Gameplay"), 1u);
    EXPECT_FALSE(state.last_known_good_scene.has_value());
    EXPECT_FALSE(state.fallback_engaged);

    auto entries = notifier_->entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[1].severity, Severity::INFO);
    EXPECT_NE(entries[1].message.find("Gameplay"), std::string::npos);
}

TEST_F(FailoverControllerTest, PreviousBehaviorWithoutCapturedSceneDoesNotSwitch) {
    build("previous");
    MonitorState recovered = recoveredState(failedState());

    MonitorState state = controller_->enterHealthy(recovered);

    EXPECT_EQ(switcher_->switchCount(), 0u);
    EXPECT_FALSE(state.last_known_good_scene.has_value());
    ASSERT_EQ(notifier_->entries().size(), 1u);
    EXPECT_EQ(notifier_->entries()[0].severity, Severity::INFO);
}

TEST_F(FailoverControllerTest, ManualBehaviorOnlyNotifies) {
    build("manual");

    MonitorState failed = controller_->handle(Transition::ENTER_FAILED, failedState());
    size_t switches_before = switcher_->switchCount();
    MonitorState state = controller_->handle(Transition::ENTER_HEALTHY, recoveredState(failed));

    EXPECT_EQ(switcher_->switchCount(), switches_before);
    EXPECT_FALSE(state.last_known_good_scene.has_value());

    auto entries = notifier_->entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[1].severity, Severity::INFO);
    EXPECT_NE(entries[1].message.find("Manual"), std::string::npos);
}

TEST_F(FailoverControllerTest, NamedSceneBehaviorSwitchesToThatScene) {
    build("Starting Soon");

    MonitorState failed = controller_->handle(Transition::ENTER_FAILED, failedState());
    MonitorState state = controller_->handle(Transition::ENTER_HEALTHY, recoveredState(failed));

    EXPECT_EQ(switcher_->switchCountTo("Starting Soon"), 1u);
    EXPECT_EQ(switcher_->switchCountTo("Gameplay"), 0u);
    EXPECT_FALSE(state.last_known_good_scene.has_value());
}

TEST_F(FailoverControllerTest, FailedRestoreIsNotRetried) {
    build("previous");

    MonitorState failed = controller_->handle(Transition::ENTER_FAILED, failedState());
    switcher_->failNextSwitches(1);
    MonitorState state = controller_->handle(Transition::ENTER_HEALTHY, recoveredState(failed));

    EXPECT_EQ(state.last_known_good_scene, std::optional<std::string>("Gameplay"));
    EXPECT_EQ(switcher_->switchCountTo("Gameplay"), 1u);

    // Healthy cycles afterwards do not touch the switcher
    for (int i = 0; i < 5; ++i) {
        state = controller_->handle(std::nullopt, state);
    }
    EXPECT_EQ(switcher_->switchCountTo("Gameplay"), 1u);
}

TEST_F(FailoverControllerTest, ThrowingSinkKeepsFailoverState) {
    build();
    FailoverController controller(config_, switcher_, std::make_shared<ThrowingNotificationSink>());

    MonitorState state;
    EXPECT_NO_THROW(state = controller.handle(Transition::ENTER_FAILED, failedState()));

    EXPECT_TRUE(state.fallback_engaged);
    EXPECT_EQ(state.last_known_good_scene, std::optional<std::string>("Gameplay"));
    EXPECT_EQ(switcher_->switchCountTo("BRB"), 1u);
}

TEST_F(FailoverControllerTest, NotificationsCanBeDisabled) {
    Config quiet = loadConfig(
        "monitor:\n  enabled: true\n  notifications: false\n"
        "telemetry:\n  stats_url: http://belabox.test/stats\n");
    FailoverController controller(quiet, switcher_, notifier_);

    MonitorState failed = controller.handle(Transition::ENTER_FAILED, failedState());
    controller.handle(Transition::ENTER_HEALTHY, recoveredState(failed));

    EXPECT_EQ(switcher_->switchCount(), 2u);
    EXPECT_TRUE(notifier_->entries().empty());
}
