#include "WebhookNotifier.h"
#include <nlohmann/json.hpp>
#include <iostream>

DeliveryResult classifyDelivery(const HttpResult& result) {
    if (result.isSuccess()) {
        return DeliveryResult::DELIVERED;
    }
    if (result.transport_ok && (result.status == 404 || result.status == 410)) {
        return DeliveryResult::TARGET_GONE;
    }
    return DeliveryResult::FAILED;
}

void WebhookRegistry::add(const WebhookTarget& target) {
    std::lock_guard<std::mutex> lock(mutex_);
    targets_[target.id] = target;
}

bool WebhookRegistry::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return targets_.erase(id) > 0;
}

bool WebhookRegistry::evict(const std::string& id, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (targets_.erase(id) == 0) {
        return false;
    }
    std::cerr << "[WebhookRegistry] Evicted webhook '" << id << "': " << reason << std::endl;
    return true;
}

std::vector<WebhookTarget> WebhookRegistry::targets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<WebhookTarget> result;
    result.reserve(targets_.size());
    for (const auto& entry : targets_) {
        result.push_back(entry.second);
    }
    return result;
}

size_t WebhookRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return targets_.size();
}

WebhookNotificationSink::WebhookNotificationSink(std::shared_ptr<WebhookRegistry> registry,
                                                 std::shared_ptr<HttpClient> http_client)
    : registry_(std::move(registry)),
      poster_([http_client](const std::string& url, const std::string& body, long timeout_sec) {
          return http_client->postJson(url, body, timeout_sec);
      }) {
}

WebhookNotificationSink::WebhookNotificationSink(std::shared_ptr<WebhookRegistry> registry, Poster poster)
    : registry_(std::move(registry)),
      poster_(std::move(poster)) {
}

void WebhookNotificationSink::notify(const std::string& message, Severity severity) {
    std::string body;
    try {
        nlohmann::json payload = {
            {"content", message},
            {"severity", toString(severity)}
        };
        // Messages can quote raw endpoint bytes, invalid UTF-8 is replaced
        body = payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[WebhookNotificationSink] Could not encode notification: " << e.what() << std::endl;
        return;
    }

    for (const auto& target : registry_->targets()) {
        HttpResult result;
        try {
            result = poster_(target.url, body, DELIVERY_TIMEOUT_SEC);
        } catch (const std::exception& e) {
            std::cerr << "[WebhookNotificationSink] Delivery to '" << target.id << "' threw: " << e.what() << std::endl;
            continue;
        }

        switch (classifyDelivery(result)) {
            case DeliveryResult::DELIVERED:
                break;
            case DeliveryResult::TARGET_GONE:
                registry_->evict(target.id, "HTTP " + std::to_string(result.status));
                break;
            case DeliveryResult::FAILED:
                std::cerr << "[WebhookNotificationSink] Delivery to '" << target.id << "' failed: "
                          << (result.transport_ok ? "HTTP " + std::to_string(result.status) : result.error)
                          << std::endl;
                break;
        }
    }
}
