#pragma once

#include "Config.h"
#include "MonitorLoop.h"
#include "Updatable.h"
#include <string>

/**
 * Renders the monitor status panel and pushes it to an Updatable target.
 * The same panel feeds the periodic console refresh and the HTTP /status
 * response.
 */
class StatusPanel {
public:
    StatusPanel(const Config& config, const MonitorLoop& monitor);

    std::string render() const;

    void refresh(Updatable& target) const;

private:
    const Config& config_;
    const MonitorLoop& monitor_;
};
