#include "NotificationSink.h"
#include <iostream>

void LogNotificationSink::notify(const std::string& message, Severity severity) {
    std::ostream& out = (severity == Severity::INFO) ? std::cout : std::cerr;
    out << "[Notification][" << toString(severity) << "] " << message << std::endl;
}

void FanoutNotificationSink::addSink(std::shared_ptr<NotificationSink> sink) {
    if (!sink) {
        return;
    }
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks_.push_back(std::move(sink));
}

void FanoutNotificationSink::notify(const std::string& message, Severity severity) {
    std::vector<std::shared_ptr<NotificationSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        sinks = sinks_;
    }

    for (const auto& sink : sinks) {
        sink->notify(message, severity);
    }
}
