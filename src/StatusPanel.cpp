#include "StatusPanel.h"
#include "StatusFormatter.h"

StatusPanel::StatusPanel(const Config& config, const MonitorLoop& monitor)
    : config_(config),
      monitor_(monitor) {
}

std::string StatusPanel::render() const {
    return StatusFormatter::formatText(monitor_.status(), config_, MonitorClock::now());
}

void StatusPanel::refresh(Updatable& target) const {
    target.display(render());
}
