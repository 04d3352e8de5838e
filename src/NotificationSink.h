#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

enum class Severity {
    INFO,
    WARNING,
    ERROR
};

inline const char* toString(Severity severity) {
    switch (severity) {
        case Severity::INFO:
            return "info";
        case Severity::WARNING:
            return "warning";
        case Severity::ERROR:
            return "error";
        default:
            return "unknown";
    }
}

/**
 * Outbound alert channel. notify() must not throw; delivery failures are
 * the sink's own business.
 */
class NotificationSink {
public:
    virtual ~NotificationSink() = default;

    virtual void notify(const std::string& message, Severity severity) = 0;
};

// Writes notifications to the log
class LogNotificationSink : public NotificationSink {
public:
    void notify(const std::string& message, Severity severity) override;
};

// Forwards every notification to each registered sink, in order
class FanoutNotificationSink : public NotificationSink {
public:
    void addSink(std::shared_ptr<NotificationSink> sink);

    void notify(const std::string& message, Severity severity) override;

private:
    std::mutex sinks_mutex_;
    std::vector<std::shared_ptr<NotificationSink>> sinks_;
};
