#pragma once

#include <optional>
#include <string>

/**
 * Scene control on the video switcher. Implementations report failures
 * through their return values and must not throw.
 */
class SceneSwitcher {
public:
    virtual ~SceneSwitcher() = default;

    // Returns true once the switcher confirmed the scene change
    virtual bool switchScene(const std::string& name) = 0;

    // Currently active program scene, empty if it could not be determined
    virtual std::optional<std::string> getCurrentScene() = 0;
};
