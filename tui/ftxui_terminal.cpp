#include "ftxui_terminal.h"

#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/terminal.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <csignal>

namespace gcm {

namespace {

struct SpecialKey {
    const ftxui::Event& event;
    KeyCode code;
};

std::optional<KeyEvent> specialKey(const ftxui::Event& event) {
    static const SpecialKey keys[] = {
        {ftxui::Event::ArrowUp, KeyCode::Up},
        {ftxui::Event::ArrowDown, KeyCode::Down},
        {ftxui::Event::ArrowLeft, KeyCode::Left},
        {ftxui::Event::ArrowRight, KeyCode::Right},
        {ftxui::Event::Return, KeyCode::Enter},
        {ftxui::Event::Tab, KeyCode::Tab},
        {ftxui::Event::TabReverse, KeyCode::BackTab},
        {ftxui::Event::Backspace, KeyCode::Backspace},
        {ftxui::Event::Delete, KeyCode::Delete},
        {ftxui::Event::Insert, KeyCode::Insert},
        {ftxui::Event::Home, KeyCode::Home},
        {ftxui::Event::End, KeyCode::End},
        {ftxui::Event::PageUp, KeyCode::PageUp},
        {ftxui::Event::PageDown, KeyCode::PageDown},
        {ftxui::Event::Escape, KeyCode::Esc},
    };
    for (const auto& key : keys) {
        if (event == key.event) return KeyEvent::special(key.code);
    }

    static const ftxui::Event* functionKeys[] = {
        &ftxui::Event::F1, &ftxui::Event::F2, &ftxui::Event::F3,  &ftxui::Event::F4,
        &ftxui::Event::F5, &ftxui::Event::F6, &ftxui::Event::F7,  &ftxui::Event::F8,
        &ftxui::Event::F9, &ftxui::Event::F10, &ftxui::Event::F11, &ftxui::Event::F12,
    };
    for (int i = 0; i < 12; ++i) {
        if (event == *functionKeys[i]) return KeyEvent::function(i + 1);
    }
    return std::nullopt;
}

std::optional<KeyEvent> convertKey(const ftxui::Event& event) {
    if (auto key = specialKey(event)) return key;

    const std::string& raw = event.input();
    if (raw.size() == 1) {
        unsigned char byte = raw[0];
        if (byte == 0) {
            KeyEvent key = KeyEvent::character(" ");
            key.ctrl = true;
            return key;
        }
        if (byte >= 1 && byte <= 26) {
            return KeyEvent::ctrlChar(static_cast<char>('a' + byte - 1));
        }
    }
    // ESC prefix is how terminals send Alt+key
    if (raw.size() == 2 && raw[0] == '\x1b' && static_cast<unsigned char>(raw[1]) >= 32) {
        KeyEvent key = KeyEvent::character(raw.substr(1));
        key.alt = true;
        return key;
    }
    if (event.is_character()) {
        return KeyEvent::character(event.character());
    }
    return std::nullopt;
}

}  // namespace

std::optional<Event> convertEvent(ftxui::Event& event) {
    if (event == ftxui::Event::Custom) return std::nullopt;

    if (event.is_mouse()) {
        const ftxui::Mouse& mouse = event.mouse();
        MouseEvent out;
        out.x = mouse.x;
        out.y = mouse.y;
        if (mouse.button == ftxui::Mouse::WheelUp) {
            out.kind = MouseEvent::Kind::WheelUp;
        } else if (mouse.button == ftxui::Mouse::WheelDown) {
            out.kind = MouseEvent::Kind::WheelDown;
        } else if (mouse.motion == ftxui::Mouse::Pressed) {
            out.kind = MouseEvent::Kind::Press;
        } else if (mouse.motion == ftxui::Mouse::Released) {
            out.kind = MouseEvent::Kind::Release;
        } else {
            out.kind = MouseEvent::Kind::Move;
        }
        return Event::mouseEvent(out);
    }

    if (auto key = convertKey(event)) return Event::keyPress(*key);
    return std::nullopt;
}

FtxuiTerminal::FtxuiTerminal(double tickRate, double frameRate)
    : screen_(ftxui::ScreenInteractive::Fullscreen()),
      tickInterval_(std::chrono::nanoseconds(static_cast<long long>(1e9 / tickRate))),
      frameInterval_(std::chrono::nanoseconds(static_cast<long long>(1e9 / frameRate))) {
    // Ctrl+C and Ctrl+Z go through the keymap like any other key
    screen_.ForceHandleCtrlC(false);
    screen_.ForceHandleCtrlZ(false);

    auto renderer = ftxui::Renderer([this] { return frame_ ? frame_ : ftxui::text(""); });
    root_ = ftxui::CatchEvent(renderer, [this](ftxui::Event event) {
        if (auto converted = convertEvent(event)) {
            pending_.push_back(*converted);
        }
        return true;
    });

    auto dim = ftxui::Terminal::Size();
    size_ = Size{static_cast<uint16_t>(dim.dimx), static_cast<uint16_t>(dim.dimy)};
}

FtxuiTerminal::~FtxuiTerminal() {
    exit();
}

void FtxuiTerminal::enter() {
    if (loop_) return;
    loop_ = std::make_unique<ftxui::Loop>(&screen_, root_);
    startTicker();
    spdlog::debug("Terminal entered ({}x{})", size_.width, size_.height);
}

void FtxuiTerminal::exit() {
    stopTicker();
    if (!loop_) return;
    screen_.Exit();
    loop_.reset();
    pending_.clear();
    spdlog::debug("Terminal restored");
}

void FtxuiTerminal::suspend() {
    stopTicker();
    screen_.WithRestoredIO([] { std::raise(SIGTSTP); })();
    startTicker();
}

void FtxuiTerminal::clear() {
    screen_.Clear();
    screen_.PostEvent(ftxui::Event::Custom);
}

void FtxuiTerminal::resize(Size size) {
    size_ = size;
}

void FtxuiTerminal::draw(ftxui::Element frame) {
    frame_ = std::move(frame);
    if (!loop_) return;
    // Custom invalidates the frame; RunOnce paints it without blocking
    screen_.PostEvent(ftxui::Event::Custom);
    loop_->RunOnce();
}

std::optional<Event> FtxuiTerminal::nextEvent() {
    while (pending_.empty()) {
        if (!loop_ || loop_->HasQuitted()) return std::nullopt;
        loop_->RunOnceBlocking();
    }
    Event event = pending_.front();
    pending_.pop_front();
    return event;
}

void FtxuiTerminal::runRestored(const std::function<void()>& fn) {
    stopTicker();
    screen_.WithRestoredIO(fn)();
    startTicker();
}

void FtxuiTerminal::post(Event event) {
    screen_.Post([this, event] { pending_.push_back(event); });
}

void FtxuiTerminal::startTicker() {
    if (ticker_.joinable()) return;
    {
        std::lock_guard<std::mutex> lock(tickerMutex_);
        tickerStop_ = false;
    }
    ticker_ = std::thread([this] { tickerLoop(); });
}

void FtxuiTerminal::stopTicker() {
    if (!ticker_.joinable()) return;
    {
        std::lock_guard<std::mutex> lock(tickerMutex_);
        tickerStop_ = true;
    }
    tickerCv_.notify_all();
    ticker_.join();
}

void FtxuiTerminal::tickerLoop() {
    using Clock = std::chrono::steady_clock;
    auto nextTick = Clock::now() + tickInterval_;
    auto nextFrame = Clock::now() + frameInterval_;
    Size lastSize = size_;

    std::unique_lock<std::mutex> lock(tickerMutex_);
    while (!tickerStop_) {
        auto wakeAt = std::min(nextTick, nextFrame);
        if (tickerCv_.wait_until(lock, wakeAt, [this] { return tickerStop_; })) break;

        auto now = Clock::now();
        if (now >= nextTick) {
            auto dim = ftxui::Terminal::Size();
            Size current{static_cast<uint16_t>(dim.dimx), static_cast<uint16_t>(dim.dimy)};
            if (current != lastSize) {
                lastSize = current;
                post(Event::resize(current.width, current.height));
            }
            post(Event::tick());
            nextTick = now + tickInterval_;
        }
        if (now >= nextFrame) {
            post(Event::render());
            nextFrame = now + frameInterval_;
        }
    }
}

}  // namespace gcm
