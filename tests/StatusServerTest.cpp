#include "StatusServer.h"
#include "FakeCollaborators.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cstring>
#include <memory>

using json = nlohmann::json;

namespace {

struct ParsedResponse {
    int code = 0;
    std::string headers;
    std::string body;
};

ParsedResponse parseResponse(const std::string& wire) {
    ParsedResponse parsed;
    size_t header_end = wire.find("\r\n\r\n");
    parsed.headers = wire.substr(0, header_end);
    parsed.body = header_end == std::string::npos ? "" : wire.substr(header_end + 4);
    // "HTTP/1.1 200 OK"
    parsed.code = std::stoi(wire.substr(9, 3));
    return parsed;
}

// Sends one raw request to 127.0.0.1:port; empty when the connection is refused
std::string sendOverSocket(uint16_t port, const std::string& raw_request) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return "";
    }

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);

    if (connect(fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        close(fd);
        return "";
    }

    std::string response;
    if (write(fd, raw_request.data(), raw_request.size()) == static_cast<ssize_t>(raw_request.size())) {
        char buffer[4096];
        ssize_t n;
        while ((n = read(fd, buffer, sizeof(buffer))) > 0) {
            response.append(buffer, n);
        }
    }
    close(fd);
    return response;
}

}  // namespace

class StatusServerTest : public ::testing::Test {
protected:
    void build(const std::string& yaml) {
        if (monitor_) {
            monitor_->stop();
        }
        server_.reset();
        monitor_.reset();

        config_ = loadConfig(yaml);
        auto fetcher = fetcher_;
        auto probe = std::make_shared<HealthProbe>(config_, [fetcher](const std::string& url, long timeout_sec) {
            return fetcher->fetch(url, timeout_sec);
        });
        auto controller = std::make_shared<FailoverController>(config_, switcher_, notifier_);
        monitor_ = std::make_unique<MonitorLoop>(config_, probe, controller);
        server_ = std::make_unique<StatusServer>(config_.getStatusPort(), config_, *monitor_);
    }

    void SetUp() override { build(scenarioYaml()); }

    void TearDown() override {
        server_.reset();
        if (monitor_) {
            monitor_->stop();
        }
    }

    ParsedResponse request(const std::string& method, const std::string& path) {
        return parseResponse(server_->handleRequest(method, path, ""));
    }

    Config config_;
    std::shared_ptr<ScriptedFetcher> fetcher_ = std::make_shared<ScriptedFetcher>(healthyResponse());
    std::shared_ptr<FakeSceneSwitcher> switcher_ = std::make_shared<FakeSceneSwitcher>("Gameplay");
    std::shared_ptr<RecordingNotificationSink> notifier_ = std::make_shared<RecordingNotificationSink>();
    std::unique_ptr<MonitorLoop> monitor_;
    std::unique_ptr<StatusServer> server_;
};

TEST_F(StatusServerTest, UnknownRouteIsNotFound) {
    ParsedResponse response = request("GET", "/nope");

    EXPECT_EQ(response.code, 404);
    EXPECT_EQ(json::parse(response.body)["error"], "Not found");
}

TEST_F(StatusServerTest, WrongMethodIsNotFound) {
    EXPECT_EQ(request("GET", "/monitor/start").code, 404);
    EXPECT_EQ(request("POST", "/status").code, 404);
}

TEST_F(StatusServerTest, StatusReportsStoppedMonitor) {
    ParsedResponse response = request("GET", "/status?verbose=1");

    EXPECT_EQ(response.code, 200);
    EXPECT_NE(response.headers.find("Content-Type: application/json"), std::string::npos);

    json body = json::parse(response.body);
    EXPECT_FALSE(body["running"].get<bool>());
    EXPECT_EQ(body["phase"], "healthy");
    EXPECT_EQ(body["fallback_scene"], "BRB");
}

TEST_F(StatusServerTest, StatusTextIsThePanel) {
    ParsedResponse response = request("GET", "/status.txt");

    EXPECT_EQ(response.code, 200);
    EXPECT_NE(response.headers.find("text/plain"), std::string::npos);
    EXPECT_EQ(response.body.rfind("Connection Monitor: Stopped", 0), 0u);
}

TEST_F(StatusServerTest, ContentLengthMatchesBody) {
    ParsedResponse response = request("GET", "/health");

    EXPECT_NE(response.headers.find("Content-Length: " + std::to_string(response.body.size())),
              std::string::npos);
}

TEST_F(StatusServerTest, ProbeRunsImmediatelyWithoutChangingState) {
    fetcher_->set(httpStatus(503, "busy"));

    ParsedResponse response = request("GET", "/probe");

    EXPECT_EQ(response.code, 200);
    json body = json::parse(response.body);
    EXPECT_FALSE(body["online"].get<bool>());
    EXPECT_EQ(body["error"], "HTTP 503");
    EXPECT_EQ(body["http_status"], 503);
    EXPECT_EQ(body["raw_response"], "busy");
    EXPECT_EQ(monitor_->status().state.cycles, 0u);
}

TEST_F(StatusServerTest, ProbeTextShowsRawResponse) {
    ParsedResponse response = request("GET", "/probe.txt");

    EXPECT_EQ(response.code, 200);
    EXPECT_NE(response.body.find("HTTP Status: 200"), std::string::npos);
    EXPECT_NE(response.body.find("Raw Response:"), std::string::npos);
}

TEST_F(StatusServerTest, StartAndStopMonitor) {
    ParsedResponse started = request("POST", "/monitor/start");
    EXPECT_EQ(started.code, 200);
    EXPECT_TRUE(json::parse(started.body)["running"].get<bool>());
    EXPECT_TRUE(monitor_->isRunning());

    ParsedResponse stopped = request("POST", "/monitor/stop");
    EXPECT_EQ(stopped.code, 200);
    EXPECT_FALSE(json::parse(stopped.body)["running"].get<bool>());
    EXPECT_FALSE(monitor_->isRunning());
}

TEST_F(StatusServerTest, ToggleFlipsRunningState) {
    EXPECT_TRUE(json::parse(request("POST", "/monitor/toggle").body)["running"].get<bool>());
    EXPECT_TRUE(monitor_->isRunning());

    EXPECT_FALSE(json::parse(request("POST", "/monitor/toggle").body)["running"].get<bool>());
    EXPECT_FALSE(monitor_->isRunning());
}

TEST_F(StatusServerTest, StartWithoutEndpointIsServiceUnavailable) {
    build("monitor:\n  enabled: true\n");

    ParsedResponse response = request("POST", "/monitor/start");

    EXPECT_EQ(response.code, 503);
    EXPECT_FALSE(json::parse(response.body)["error"].get<std::string>().empty());
    EXPECT_FALSE(monitor_->isRunning());
}

TEST_F(StatusServerTest, StartWhenDisabledIsConflict) {
    build("monitor:\n  enabled: false\ntelemetry:\n  stats_url: http://belabox.test/stats\n");

    ParsedResponse response = request("POST", "/monitor/start");

    EXPECT_EQ(response.code, 409);
    EXPECT_FALSE(monitor_->isRunning());
}

TEST_F(StatusServerTest, StatusSurvivesRawBytesInOfflineReason) {
    fetcher_->set(httpOk("\xff garbage"));
    monitor_->runCycle(atSeconds(0));

    ParsedResponse response;
    ASSERT_NO_THROW(response = request("GET", "/status"));

    EXPECT_EQ(response.code, 200);
    json body = json::parse(response.body);
    EXPECT_FALSE(body["health"]["online"].get<bool>());
    EXPECT_EQ(body["health"]["error"].get<std::string>().rfind("parse error: ", 0), 0u);
    EXPECT_EQ(request("GET", "/status.txt").code, 200);
}

TEST_F(StatusServerTest, StoppedServerRefusesControlRequests) {
    build(scenarioYaml() + "status_port: 18092\n");
    ASSERT_TRUE(server_->start());

    std::string started = sendOverSocket(18092, "POST /monitor/start HTTP/1.1\r\nHost: localhost\r\n\r\n");
    ASSERT_FALSE(started.empty());
    EXPECT_EQ(parseResponse(started).code, 200);
    EXPECT_TRUE(monitor_->isRunning());

    server_->stop();
    monitor_->stop();

    EXPECT_TRUE(sendOverSocket(18092, "POST /monitor/start HTTP/1.1\r\nHost: localhost\r\n\r\n").empty());
    EXPECT_FALSE(monitor_->isRunning());
}

TEST_F(StatusServerTest, HealthReportsMonitorState) {
    ParsedResponse response = request("GET", "/health");

    EXPECT_EQ(response.code, 200);
    json body = json::parse(response.body);
    EXPECT_EQ(body["status"], "ok");
    EXPECT_FALSE(body["monitor_running"].get<bool>());
}
