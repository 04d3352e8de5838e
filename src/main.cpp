#include "Config.h"
#include "ControllerSceneSwitcher.h"
#include "FailoverController.h"
#include "HealthProbe.h"
#include "HttpClient.h"
#include "MonitorLoop.h"
#include "NotificationSink.h"
#include "StatusPanel.h"
#include "StatusServer.h"
#include "Updatable.h"
#include "WebhookNotifier.h"
#include <iostream>
#include <csignal>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

// Global flag for shutdown signal
static std::atomic<bool> g_shutdown(false);

// Signal handler for graceful shutdown
void signalHandler(int signal) {
    (void)signal;
    g_shutdown = true;
}

int main(int argc, char* argv[]) {
    std::cout << "=== linkwatch - encoder link monitor and scene failover ===" << std::endl;
    std::cout << "Version 1.0.0" << std::endl;
    std::cout << std::endl;

    // Check arguments
    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <config.yaml>" << std::endl;
        return 1;
    }

    std::string config_file = argv[1];

    // Load configuration
    Config config;
    if (!config.loadFromFile(config_file)) {
        std::cerr << "[Main] Failed to load configuration from " << config_file << std::endl;
        return 1;
    }

    std::cout << "[Main] Configuration loaded successfully" << std::endl;
    config.print();
    std::cout << std::endl;

    // Setup signal handlers for graceful shutdown
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    auto http_client = std::make_shared<HttpClient>();

    // Scene control goes through the scene controller's REST API
    auto scene_switcher = std::make_shared<ControllerSceneSwitcher>(config.getControllerUrl(), http_client);

    // Notifications: always logged, optionally posted to webhooks
    auto notifier = std::make_shared<FanoutNotificationSink>();
    notifier->addSink(std::make_shared<LogNotificationSink>());

    auto webhook_registry = std::make_shared<WebhookRegistry>();
    for (const auto& target : config.getWebhooks()) {
        webhook_registry->add(target);
    }
    if (webhook_registry->size() > 0) {
        notifier->addSink(std::make_shared<WebhookNotificationSink>(webhook_registry, http_client));
        std::cout << "[Main] Posting notifications to " << webhook_registry->size() << " webhook(s)" << std::endl;
    }

    auto probe = std::make_shared<HealthProbe>(config, http_client);
    auto controller = std::make_shared<FailoverController>(config, scene_switcher, notifier);
    MonitorLoop monitor(config, probe, controller);

    StatusServer status_server(config.getStatusPort(), config, monitor);
    if (!status_server.start()) {
        // Monitoring still works without the status surface
        std::cerr << "[Main] Status server unavailable on port " << config.getStatusPort() << std::endl;
    }

    // A refused start (config error, disabled) leaves the process up so the
    // status surface can report it
    if (monitor.start()) {
        std::cout << "[Main] Monitoring started (press Ctrl+C to stop)..." << std::endl;
    } else {
        std::cout << "[Main] Monitoring not started, status surface only" << std::endl;
    }

    ConsoleStatusDisplay console;
    StatusPanel panel(config, monitor);
    auto last_refresh = std::chrono::steady_clock::now();
    const auto refresh_interval = std::chrono::seconds(config.getStatusRefreshSec());

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        auto now = std::chrono::steady_clock::now();
        if (refresh_interval.count() > 0 && now - last_refresh >= refresh_interval) {
            panel.refresh(console);
            last_refresh = now;
        }
    }

    std::cout << "\n[Main] Shutting down..." << std::endl;

    // Close the control surface before the monitor so nothing can restart it
    status_server.stop();
    monitor.stop();

    std::cout << "[Main] Shutdown complete" << std::endl;
    return 0;
}
