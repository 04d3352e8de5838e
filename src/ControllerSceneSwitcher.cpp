#include "ControllerSceneSwitcher.h"
#include <nlohmann/json.hpp>
#include <iostream>
#include <utility>

using json = nlohmann::json;

ControllerSceneSwitcher::ControllerSceneSwitcher(const std::string& controller_url,
                                                 std::shared_ptr<HttpClient> http_client)
    : ControllerSceneSwitcher(
          controller_url,
          [http_client](const std::string& url, long timeout_sec) {
              return http_client->get(url, timeout_sec);
          },
          [http_client](const std::string& url, const std::string& body, long timeout_sec) {
              return http_client->postJson(url, body, timeout_sec);
          }) {
}

ControllerSceneSwitcher::ControllerSceneSwitcher(const std::string& controller_url, Getter getter, Poster poster)
    : controller_url_(controller_url),
      getter_(std::move(getter)),
      poster_(std::move(poster)) {
    std::cout << "[ControllerSceneSwitcher] Initialized with controller URL: " << controller_url_ << std::endl;
}

std::string ControllerSceneSwitcher::sceneEndpoint() const {
    std::string url = controller_url_;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url + "/scene";
}

bool ControllerSceneSwitcher::switchScene(const std::string& name) {
    json body = {{"scene", name}};
    HttpResult result = poster_(sceneEndpoint(), body.dump(), REQUEST_TIMEOUT_SEC);

    if (!result.isSuccess()) {
        std::cerr << "[ControllerSceneSwitcher] Switch to '" << name << "' rejected: "
                  << (result.transport_ok ? "HTTP " + std::to_string(result.status) : result.error)
                  << std::endl;
        return false;
    }

    std::cout << "[ControllerSceneSwitcher] Switched to '" << name << "' (HTTP " << result.status << ")" << std::endl;
    return true;
}

std::optional<std::string> ControllerSceneSwitcher::getCurrentScene() {
    HttpResult result = getter_(sceneEndpoint(), REQUEST_TIMEOUT_SEC);
    if (!result.isSuccess()) {
        return std::nullopt;
    }

    try {
        json data = json::parse(result.body);
        auto scene = data.find("scene");
        if (scene == data.end() || !scene->is_string()) {
            std::cerr << "[ControllerSceneSwitcher] GET /scene response has no 'scene' string" << std::endl;
            return std::nullopt;
        }
        std::string name = scene->get<std::string>();
        if (name.empty() || name == "unknown") {
            return std::nullopt;
        }
        return name;
    } catch (const json::exception& e) {
        std::cerr << "[ControllerSceneSwitcher] Invalid GET /scene response: " << e.what() << std::endl;
        return std::nullopt;
    }
}
