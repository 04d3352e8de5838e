#pragma once

#include <string>

/**
 * Outcome of one blocking HTTP request.
 * transport_ok is false when no HTTP response was received at all
 * (timeout, connection refused, DNS failure); status is 0 in that case.
 */
struct HttpResult {
    bool transport_ok = false;
    bool timed_out = false;
    long status = 0;
    std::string body;
    std::string error;  // curl error text when transport_ok == false

    bool isSuccess() const { return transport_ok && status >= 200 && status < 300; }
};

/**
 * Simple HTTP client using libcurl for the telemetry endpoint, the scene
 * controller and notification webhooks. All calls block for at most the
 * given timeout and never throw.
 */
class HttpClient {
public:
    HttpClient();
    ~HttpClient();

    // Prevent copying
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Generic HTTP GET (blocking)
    HttpResult get(const std::string& url, long timeout_sec) const;

    // HTTP POST with a JSON body (blocking)
    HttpResult postJson(const std::string& url, const std::string& body, long timeout_sec) const;

private:
    HttpResult perform(const std::string& method, const std::string& url,
                       const std::string* body, long timeout_sec) const;
};
