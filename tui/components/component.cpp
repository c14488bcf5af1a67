#include "component.h"

#include <spdlog/spdlog.h>

namespace gcm {
namespace components {

std::optional<Action> Component::handleEvents(const std::optional<Event>& event) {
    if (!event) return std::nullopt;

    switch (event->type) {
        case EventType::Key:
            return handleKeyEvent(event->key);
        case EventType::Mouse:
            return handleMouseEvent(event->mouse);
        default:
            return std::nullopt;
    }
}

void Component::send(Action action) const {
    std::string name = toString(action);
    if (!sender_.send(std::move(action))) {
        spdlog::debug("Dropped {}: action channel closed", name);
    }
}

}  // namespace components
}  // namespace gcm
