#pragma once

#include "Config.h"
#include "HttpClient.h"
#include "NotificationSink.h"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

enum class DeliveryResult {
    DELIVERED,
    FAILED,       // Transient, target stays registered
    TARGET_GONE   // Target no longer reachable (HTTP 404 / 410), evict it
};

DeliveryResult classifyDelivery(const HttpResult& result);

/**
 * WebhookRegistry - registered notification targets keyed by id.
 * Thread-safe. Targets are only removed explicitly or by evict().
 */
class WebhookRegistry {
public:
    // Adds or replaces the target with the same id
    void add(const WebhookTarget& target);

    bool remove(const std::string& id);

    // Removes a target that reported itself gone, logging the reason
    bool evict(const std::string& id, const std::string& reason);

    std::vector<WebhookTarget> targets() const;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, WebhookTarget> targets_;
};

/**
 * Posts {"content": "...", "severity": "..."} to every registered webhook
 * (Discord-compatible payload). Delivery is synchronous and bounded by
 * DELIVERY_TIMEOUT_SEC per target.
 */
class WebhookNotificationSink : public NotificationSink {
public:
    using Poster = std::function<HttpResult(const std::string& url, const std::string& body, long timeout_sec)>;

    static constexpr long DELIVERY_TIMEOUT_SEC = 5;

    WebhookNotificationSink(std::shared_ptr<WebhookRegistry> registry, std::shared_ptr<HttpClient> http_client);
    WebhookNotificationSink(std::shared_ptr<WebhookRegistry> registry, Poster poster);

    void notify(const std::string& message, Severity severity) override;

private:
    std::shared_ptr<WebhookRegistry> registry_;
    Poster poster_;
};
