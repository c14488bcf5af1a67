#ifndef GCM_TUI_FTXUI_TERMINAL_H
#define GCM_TUI_FTXUI_TERMINAL_H

#include "terminal.h"
#include <ftxui/component/component.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/loop.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>

namespace gcm {

// Converts an FTXUI input event. Returns nullopt for events that carry
// nothing for the application (cursor reports, Custom).
std::optional<Event> convertEvent(ftxui::Event& event);

// Terminal backed by ftxui::ScreenInteractive.
//
// The FTXUI loop is pumped one step at a time from nextEvent(). A ticker
// thread posts Tick and Render events at the configured rates and notices
// terminal size changes.
class FtxuiTerminal : public Terminal {
public:
    FtxuiTerminal(double tickRate, double frameRate);
    ~FtxuiTerminal() override;

    void enter() override;
    void exit() override;
    void suspend() override;

    void clear() override;
    void resize(Size size) override;
    void draw(ftxui::Element frame) override;
    Size size() const override { return size_; }

    std::optional<Event> nextEvent() override;
    void runRestored(const std::function<void()>& fn) override;

private:
    void startTicker();
    void stopTicker();
    void tickerLoop();
    void post(Event event);

    ftxui::ScreenInteractive screen_;
    ftxui::Component root_;
    std::unique_ptr<ftxui::Loop> loop_;
    ftxui::Element frame_;

    // Only touched from the loop thread (FTXUI runs posted tasks there)
    std::deque<Event> pending_;
    Size size_;

    std::chrono::nanoseconds tickInterval_;
    std::chrono::nanoseconds frameInterval_;
    std::thread ticker_;
    std::mutex tickerMutex_;
    std::condition_variable tickerCv_;
    bool tickerStop_ = false;
};

}  // namespace gcm

#endif  // GCM_TUI_FTXUI_TERMINAL_H
