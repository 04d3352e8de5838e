#pragma once

#include "SceneSwitcher.h"
#include "HttpClient.h"
#include <functional>
#include <memory>
#include <string>

/**
 * SceneSwitcher backed by the scene controller's REST API:
 *   GET  <controller_url>/scene  -> {"scene": "<name>"}
 *   POST <controller_url>/scene  <- {"scene": "<name>"}
 */
class ControllerSceneSwitcher : public SceneSwitcher {
public:
    using Getter = std::function<HttpResult(const std::string& url, long timeout_sec)>;
    using Poster = std::function<HttpResult(const std::string& url, const std::string& body, long timeout_sec)>;

    static constexpr long REQUEST_TIMEOUT_SEC = 5;

    ControllerSceneSwitcher(const std::string& controller_url, std::shared_ptr<HttpClient> http_client);

    // Talks to the controller through arbitrary functions (used by tests)
    ControllerSceneSwitcher(const std::string& controller_url, Getter getter, Poster poster);

    // Prevent copying
    ControllerSceneSwitcher(const ControllerSceneSwitcher&) = delete;
    ControllerSceneSwitcher& operator=(const ControllerSceneSwitcher&) = delete;

    bool switchScene(const std::string& name) override;
    std::optional<std::string> getCurrentScene() override;

private:
    std::string sceneEndpoint() const;

    std::string controller_url_;
    Getter getter_;
    Poster poster_;
};
