#include "MonitorLoop.h"
#include <exception>
#include <iostream>

MonitorLoop::MonitorLoop(const Config& config,
                         std::shared_ptr<HealthProbe> probe,
                         std::shared_ptr<FailoverController> controller)
    : config_(config),
      probe_(std::move(probe)),
      controller_(std::move(controller)),
      detector_(std::chrono::seconds(config.getTimeoutThresholdSec())),
      interval_(config.getCheckIntervalSec()),
      state_(std::make_shared<const MonitorState>()),
      running_(false),
      worker_id_(std::thread::id()),
      now_([]() { return MonitorClock::now(); }) {
}

MonitorLoop::~MonitorLoop() {
    stop();
}

void MonitorLoop::setTimeSource(TimeSource source) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    now_ = std::move(source);
}

bool MonitorLoop::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (running_.load()) {
        return true;
    }

    std::string error = config_.configError();
    if (!error.empty()) {
        if (!config_error_reported_) {
            std::cerr << "[MonitorLoop] Refusing to start: " << error << std::endl;
            config_error_reported_ = true;
        }
        return false;
    }

    if (!config_.isEnabled()) {
        std::cout << "[MonitorLoop] Connection monitoring is disabled in config" << std::endl;
        return false;
    }

    // A previous worker that stopped itself still needs joining
    if (worker_.joinable()) {
        worker_.join();
    }

    // Fresh state for every monitoring session
    publish(MonitorState{});

    {
        std::lock_guard<std::mutex> wake_lock(wake_mutex_);
        stop_requested_ = false;
    }

    running_ = true;
    worker_ = std::thread(&MonitorLoop::loop, this);
    worker_id_ = worker_.get_id();

    std::cout << "[MonitorLoop] Started (interval=" << interval_.count()
              << "s, timeout=" << config_.getTimeoutThresholdSec()
              << "s, fallback='" << config_.getFallbackScene() << "')" << std::endl;
    return true;
}

void MonitorLoop::stop() {
    if (worker_id_.load() == std::this_thread::get_id()) {
        // Joining ourselves would deadlock; the loop exits at its next sleep
        std::lock_guard<std::mutex> wake_lock(wake_mutex_);
        stop_requested_ = true;
        return;
    }

    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (!worker_.joinable()) {
        return;
    }

    {
        std::lock_guard<std::mutex> wake_lock(wake_mutex_);
        stop_requested_ = true;
    }
    wake_cv_.notify_all();

    // Wait for the in-flight cycle (if any) to finish
    worker_.join();
    worker_id_ = std::thread::id();
    running_ = false;

    // State does not outlive a monitoring session
    publish(MonitorState{});

    std::cout << "[MonitorLoop] Stopped" << std::endl;
}

MonitorStatus MonitorLoop::status() const {
    std::shared_ptr<const MonitorState> snapshot = std::atomic_load(&state_);

    MonitorStatus status;
    status.running = running_.load();
    status.state = *snapshot;
    status.fallback_active = snapshot->fallback_engaged;
    return status;
}

ProbeReport MonitorLoop::testProbeNow() const {
    return probe_->probe();
}

void MonitorLoop::runCycle(MonitorTime now) {
    std::shared_ptr<const MonitorState> current = std::atomic_load(&state_);

    EncoderHealth health = probe_->checkHealth();
    FailureDetector::Step step = detector_.advance(current->phase, current->pending_since, health, now);

    MonitorState next = *current;
    next.phase = step.phase;
    next.pending_since = step.pending_since;
    next.last_health = health;

    try {
        MonitorState handled = controller_->handle(step.transition, next);
        next = std::move(handled);
    } catch (const std::exception& e) {
        // Keep the detector's progress; the controller retries from FAILED
        std::cerr << "[MonitorLoop] Failover handling failed: " << e.what() << std::endl;
    }

    next.last_checked = std::chrono::system_clock::now();
    next.cycles = current->cycles + 1;

    if (config_.isDebug()) {
        std::cout << "[MonitorLoop] Cycle " << next.cycles << ": phase=" << toString(next.phase)
                  << " online=" << (health.online ? "true" : "false")
                  << (step.transition ? std::string(" transition=") + toString(*step.transition) : std::string())
                  << std::endl;
    }

    publish(std::move(next));
}

void MonitorLoop::publish(MonitorState state) {
    std::atomic_store(&state_, std::make_shared<const MonitorState>(std::move(state)));
}

void MonitorLoop::loop() {
    while (true) {
        try {
            runCycle(now_());
        } catch (const std::exception& e) {
            // Collaborators should not throw; if one does, keep monitoring
            std::cerr << "[MonitorLoop] Error in monitoring cycle: " << e.what() << std::endl;
        }

        // Cancellation is only observed here, between cycles
        std::unique_lock<std::mutex> lock(wake_mutex_);
        if (wake_cv_.wait_for(lock, interval_, [this]() { return stop_requested_; })) {
            break;
        }
    }

    running_ = false;
}
