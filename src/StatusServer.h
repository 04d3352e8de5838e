#pragma once

#include "Config.h"
#include "MonitorLoop.h"
#include "StatusPanel.h"
#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <thread>

struct HttpResponse {
    int code = 200;
    std::string content_type = "application/json";
    std::string body;

    std::string toWire() const;
};

/**
 * Minimal HTTP server exposing the monitor's status and diagnostic surface.
 * Listens on a specified port and handles:
 * - GET /status          - Monitor state as JSON
 * - GET /status.txt      - Monitor state as a text panel
 * - GET /probe           - Probe the telemetry endpoint now (JSON, raw body)
 * - GET /probe.txt       - Same as a text report
 * - POST /monitor/start  - Start monitoring
 * - POST /monitor/stop   - Stop monitoring
 * - POST /monitor/toggle - Start if stopped, stop if running
 * - GET /health          - Liveness of this process
 */
class StatusServer {
public:
    StatusServer(uint16_t port, const Config& config, MonitorLoop& monitor);
    ~StatusServer();

    // Prevent copying
    StatusServer(const StatusServer&) = delete;
    StatusServer& operator=(const StatusServer&) = delete;

    // Start the server in a background thread
    bool start();

    // Stop the server
    void stop();

    // Check if server is running
    bool isRunning() const { return running_.load(); }

    // Route one parsed request through the dispatch table, returns the full
    // HTTP response
    std::string handleRequest(const std::string& method, const std::string& path, const std::string& body);

private:
    using Handler = HttpResponse (StatusServer::*)(const std::string& body);

    // Server main loop
    void serverLoop();

    // Read one request from a connected client and answer it
    void serveClient(int client_fd);

    // Parse HTTP request and extract method, path and body
    static bool parseRequest(const std::string& request, std::string& method, std::string& path, std::string& body);

    HttpResponse handleStatus(const std::string& body);
    HttpResponse handleStatusText(const std::string& body);
    HttpResponse handleProbe(const std::string& body);
    HttpResponse handleProbeText(const std::string& body);
    HttpResponse handleStart(const std::string& body);
    HttpResponse handleStop(const std::string& body);
    HttpResponse handleToggle(const std::string& body);
    HttpResponse handleHealth(const std::string& body);

    HttpResponse startMonitor();
    HttpResponse stopMonitor();

    uint16_t port_;
    const Config& config_;
    MonitorLoop& monitor_;
    StatusPanel panel_;

    // "METHOD /path" -> handler, built once in the constructor
    const std::map<std::string, Handler> routes_;

    std::mutex control_mutex_;  // Serializes start/stop/toggle requests

    std::atomic<bool> running_;
    std::thread server_thread_;
    int server_fd_;
};
