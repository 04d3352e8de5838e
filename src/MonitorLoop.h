#pragma once

#include "Config.h"
#include "FailoverController.h"
#include "FailureDetector.h"
#include "HealthProbe.h"
#include "MonitorState.h"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

/**
 * Read-only view handed to status displays.
 */
struct MonitorStatus {
    bool running = false;
    MonitorState state;
    bool fallback_active = false;
};

/**
 * MonitorLoop - drives one Probe → Detector → Controller cycle per interval
 * on a single background thread.
 *
 * The loop thread is the only writer of MonitorState. Each cycle builds a new
 * state and publishes it with one atomic store, so status() never observes a
 * partial update.
 *
 * Usage:
 *   MonitorLoop loop(config, probe, controller);
 *   if (!loop.start()) { ... config error or monitoring disabled ... }
 *   auto snapshot = loop.status();
 *   loop.stop();  // returns after the worker has exited
 */
class MonitorLoop {
public:
    using TimeSource = std::function<MonitorTime()>;

    MonitorLoop(const Config& config,
                std::shared_ptr<HealthProbe> probe,
                std::shared_ptr<FailoverController> controller);
    ~MonitorLoop();

    // Prevent copying
    MonitorLoop(const MonitorLoop&) = delete;
    MonitorLoop& operator=(const MonitorLoop&) = delete;

    // Begin monitoring. Returns true if the loop is running afterwards.
    // Refuses (once-logged ConfigError) when enabled without a stats URL.
    bool start();

    // Cancel and wait for the worker to exit. No scene switch happens after
    // this returns. Idempotent.
    void stop();

    bool isRunning() const { return running_.load(); }

    MonitorStatus status() const;

    // Probe the endpoint right now without touching monitor state
    ProbeReport testProbeNow() const;

    // One full cycle at the given time. Called by the worker thread; tests
    // call it directly while the loop is stopped.
    void runCycle(MonitorTime now);

    // Replace the clock used by the worker thread. Call before start().
    void setTimeSource(TimeSource source);

private:
    void loop();
    void publish(MonitorState state);

    const Config& config_;
    std::shared_ptr<HealthProbe> probe_;
    std::shared_ptr<FailoverController> controller_;
    FailureDetector detector_;
    std::chrono::seconds interval_;

    // Read with std::atomic_load, replaced with std::atomic_store
    std::shared_ptr<const MonitorState> state_;

    std::atomic<bool> running_;
    std::thread worker_;
    std::atomic<std::thread::id> worker_id_;
    std::mutex lifecycle_mutex_;  // Serializes start/stop

    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    bool stop_requested_ = false;

    bool config_error_reported_ = false;
    TimeSource now_;
};
