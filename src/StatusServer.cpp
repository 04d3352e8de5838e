#include "StatusServer.h"
#include "StatusFormatter.h"
#include "Updatable.h"
#include <nlohmann/json.hpp>
#include <iostream>
#include <sstream>
#include <cstring>
#include <cerrno>
#include <cstdlib>
#include <unistd.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <fcntl.h>
#include <poll.h>

using json = nlohmann::json;

static const char* reasonPhrase(int code) {
    switch (code) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 409: return "Conflict";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

static HttpResponse jsonResponse(int code, const json& body) {
    HttpResponse response;
    response.code = code;
    response.body = body.dump();
    return response;
}

static HttpResponse textResponse(const std::string& body) {
    HttpResponse response;
    response.content_type = "text/plain; charset=utf-8";
    response.body = body;
    return response;
}

std::string HttpResponse::toWire() const {
    std::ostringstream response;
    response << "HTTP/1.1 " << code << " " << reasonPhrase(code) << "\r\n"
             << "Content-Type: " << content_type << "\r\n"
             << "Content-Length: " << body.length() << "\r\n"
             << "Connection: close\r\n"
             << "\r\n"
             << body;
    return response.str();
}

StatusServer::StatusServer(uint16_t port, const Config& config, MonitorLoop& monitor)
    : port_(port),
      config_(config),
      monitor_(monitor),
      panel_(config, monitor),
      routes_{
          {"GET /status", &StatusServer::handleStatus},
          {"GET /status.txt", &StatusServer::handleStatusText},
          {"GET /probe", &StatusServer::handleProbe},
          {"GET /probe.txt", &StatusServer::handleProbeText},
          {"POST /monitor/start", &StatusServer::handleStart},
          {"POST /monitor/stop", &StatusServer::handleStop},
          {"POST /monitor/toggle", &StatusServer::handleToggle},
          {"GET /health", &StatusServer::handleHealth},
      },
      running_(false),
      server_fd_(-1) {
}

StatusServer::~StatusServer() {
    stop();
}

bool StatusServer::start() {
    if (running_.load()) {
        std::cerr << "[StatusServer] Already running" << std::endl;
        return false;
    }

    // Create socket
    server_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        std::cerr << "[StatusServer] Failed to create socket: " << strerror(errno) << std::endl;
        return false;
    }

    // Set socket options
    int opt = 1;
    if (setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        std::cerr << "[StatusServer] Failed to set SO_REUSEADDR: " << strerror(errno) << std::endl;
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    // Set non-blocking
    int flags = fcntl(server_fd_, F_GETFL, 0);
    if (flags < 0 || fcntl(server_fd_, F_SETFL, flags | O_NONBLOCK) < 0) {
        std::cerr << "[StatusServer] Failed to set O_NONBLOCK: " << strerror(errno) << std::endl;
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    // Bind socket
    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(port_);

    if (bind(server_fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        std::cerr << "[StatusServer] Failed to bind to port " << port_ << ": " << strerror(errno) << std::endl;
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    // Listen
    if (listen(server_fd_, 5) < 0) {
        std::cerr << "[StatusServer] Failed to listen: " << strerror(errno) << std::endl;
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    running_ = true;
    server_thread_ = std::thread(&StatusServer::serverLoop, this);

    std::cout << "[StatusServer] Started on port " << port_ << std::endl;
    return true;
}

void StatusServer::stop() {
    if (!running_.load()) {
        return;
    }

    running_ = false;

    // Wait for server thread, it notices running_ within one poll timeout
    if (server_thread_.joinable()) {
        server_thread_.join();
    }

    if (server_fd_ >= 0) {
        close(server_fd_);
        server_fd_ = -1;
    }

    std::cout << "[StatusServer] Stopped" << std::endl;
}

void StatusServer::serverLoop() {
    while (running_.load()) {
        // Use poll to wait for connections with timeout
        struct pollfd pfd;
        pfd.fd = server_fd_;
        pfd.events = POLLIN;

        int ret = poll(&pfd, 1, 500); // 500ms timeout

        if (ret < 0) {
            if (errno == EINTR) continue;
            if (running_.load()) {
                std::cerr << "[StatusServer] Poll error: " << strerror(errno) << std::endl;
            }
            break;
        }

        if (ret == 0) {
            // Timeout, check running flag and continue
            continue;
        }

        // Accept connection
        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);
        int client_fd = accept(server_fd_, (struct sockaddr*)&client_addr, &client_len);

        if (client_fd < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            if (running_.load()) {
                std::cerr << "[StatusServer] Accept error: " << strerror(errno) << std::endl;
            }
            continue;
        }

        serveClient(client_fd);
        close(client_fd);
    }
}

void StatusServer::serveClient(int client_fd) {
    char buffer[4096];
    std::string full_request;

    struct pollfd read_pfd;
    read_pfd.fd = client_fd;
    read_pfd.events = POLLIN;

    // Read initial chunk (headers + possibly body)
    if (poll(&read_pfd, 1, 1000) <= 0) {
        return;
    }
    ssize_t bytes_read = read(client_fd, buffer, sizeof(buffer));
    if (bytes_read <= 0) {
        return;
    }
    full_request.append(buffer, bytes_read);

    // Read the rest of the body if Content-Length says there is more
    size_t header_end = full_request.find("\r\n\r\n");
    if (header_end != std::string::npos) {
        size_t cl_pos = full_request.find("Content-Length:");
        if (cl_pos != std::string::npos && cl_pos < header_end) {
            size_t cl_start = cl_pos + 15; // strlen("Content-Length:")
            long content_length = std::strtol(full_request.c_str() + cl_start, nullptr, 10);
            size_t body_start = header_end + 4;

            while (content_length > 0 &&
                   full_request.length() - body_start < static_cast<size_t>(content_length) &&
                   poll(&read_pfd, 1, 500) > 0) {
                bytes_read = read(client_fd, buffer, sizeof(buffer));
                if (bytes_read <= 0) {
                    break;
                }
                full_request.append(buffer, bytes_read);
            }
        }
    }

    std::string response;
    std::string method, path, body;
    if (parseRequest(full_request, method, path, body)) {
        response = handleRequest(method, path, body);
    } else {
        response = jsonResponse(400, {{"error", "Malformed request"}}).toWire();
    }

    size_t written = 0;
    while (written < response.length()) {
        ssize_t n = write(client_fd, response.c_str() + written, response.length() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[StatusServer] Failed to write response: " << strerror(errno) << std::endl;
            return;
        }
        written += static_cast<size_t>(n);
    }
}

bool StatusServer::parseRequest(const std::string& request, std::string& method, std::string& path, std::string& body) {
    // Parse first line
    std::istringstream stream(request);
    std::string line;

    if (!std::getline(stream, line)) {
        return false;
    }

    // Parse method and path
    std::istringstream first_line(line);
    std::string http_version;
    if (!(first_line >> method >> path >> http_version)) {
        return false;
    }

    // Find body (after empty line)
    size_t body_start = request.find("\r\n\r\n");
    if (body_start != std::string::npos) {
        body = request.substr(body_start + 4);
    }

    return true;
}

std::string StatusServer::handleRequest(const std::string& method, const std::string& path, const std::string& body) {
    if (config_.isDebug()) {
        std::cout << "[StatusServer] " << method << " " << path << std::endl;
    }

    // Query strings are not used by any route
    std::string route_path = path.substr(0, path.find('?'));

    auto it = routes_.find(method + " " + route_path);
    if (it == routes_.end()) {
        return jsonResponse(404, {{"error", "Not found"}}).toWire();
    }

    Handler handler = it->second;
    try {
        return (this->*handler)(body).toWire();
    } catch (const std::exception& e) {
        std::cerr << "[StatusServer] " << method << " " << route_path << " failed: " << e.what() << std::endl;
        return jsonResponse(500, {{"error", "Internal error"}}).toWire();
    }
}

HttpResponse StatusServer::handleStatus(const std::string&) {
    HttpResponse response;
    response.body = StatusFormatter::formatJson(monitor_.status(), config_, MonitorClock::now());
    return response;
}

HttpResponse StatusServer::handleStatusText(const std::string&) {
    BufferedDisplay display;
    panel_.refresh(display);
    return textResponse(display.content());
}

HttpResponse StatusServer::handleProbe(const std::string&) {
    HttpResponse response;
    response.body = StatusFormatter::formatProbeJson(monitor_.testProbeNow());
    return response;
}

HttpResponse StatusServer::handleProbeText(const std::string&) {
    return textResponse(StatusFormatter::formatProbeText(monitor_.testProbeNow()));
}

HttpResponse StatusServer::handleStart(const std::string&) {
    std::lock_guard<std::mutex> lock(control_mutex_);
    return startMonitor();
}

HttpResponse StatusServer::handleStop(const std::string&) {
    std::lock_guard<std::mutex> lock(control_mutex_);
    return stopMonitor();
}

HttpResponse StatusServer::handleToggle(const std::string&) {
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (monitor_.isRunning()) {
        return stopMonitor();
    }
    return startMonitor();
}

HttpResponse StatusServer::handleHealth(const std::string&) {
    return jsonResponse(200, {{"status", "ok"}, {"monitor_running", monitor_.isRunning()}});
}

HttpResponse StatusServer::startMonitor() {
    if (monitor_.start()) {
        return jsonResponse(200, {{"status", "ok"}, {"running", true}});
    }

    std::string error = config_.configError();
    if (!error.empty()) {
        return jsonResponse(503, {{"error", error}, {"running", false}});
    }
    return jsonResponse(409, {{"error", "Connection monitoring is disabled in config"}, {"running", false}});
}

HttpResponse StatusServer::stopMonitor() {
    monitor_.stop();
    return jsonResponse(200, {{"status", "ok"}, {"running", false}});
}
