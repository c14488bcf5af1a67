#ifndef GCM_TUI_TERMINAL_H
#define GCM_TUI_TERMINAL_H

#include "event.h"
#include <ftxui/dom/elements.hpp>
#include <cstdint>
#include <functional>
#include <optional>

namespace gcm {

struct Size {
    uint16_t width = 0;
    uint16_t height = 0;

    bool operator==(const Size&) const = default;
};

// Terminal handle and raw event source used by the App loop.
// nextEvent() is the only call that blocks.
class Terminal {
public:
    virtual ~Terminal() = default;

    // Switch to the alternate screen and start producing events
    virtual void enter() = 0;
    // Restore the terminal and stop producing events
    virtual void exit() = 0;
    // Restore the terminal, stop the process (SIGTSTP), re-enter on resume
    virtual void suspend() = 0;

    virtual void clear() = 0;
    virtual void resize(Size size) = 0;
    virtual void draw(ftxui::Element frame) = 0;
    virtual Size size() const = 0;

    // Blocks until the next event. Returns nullopt when the source has closed.
    virtual std::optional<Event> nextEvent() = 0;

    // Runs `fn` with the terminal restored to cooked mode (for launching
    // a foreground child process) and takes it back afterwards.
    virtual void runRestored(const std::function<void()>& fn) = 0;
};

}  // namespace gcm

#endif  // GCM_TUI_TERMINAL_H
