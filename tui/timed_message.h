#ifndef GCM_TUI_TIMED_MESSAGE_H
#define GCM_TUI_TIMED_MESSAGE_H

#include <chrono>
#include <optional>
#include <string>

namespace gcm {

using SteadyClock = std::chrono::steady_clock;

// A message that expires a fixed duration after it was set. Expiry is
// only checked when expireIfStale() is called (on every Tick).
class TimedMessage {
public:
    explicit TimedMessage(SteadyClock::duration displayDuration)
        : duration_(displayDuration) {}

    void set(std::string message, SteadyClock::time_point now);
    void clear() { message_.reset(); }

    // Clears the message once its age exceeds the display duration.
    // Returns true when something was cleared.
    bool expireIfStale(SteadyClock::time_point now);

    bool visible() const { return message_.has_value(); }
    const std::string& text() const;
    SteadyClock::duration duration() const { return duration_; }

private:
    SteadyClock::duration duration_;
    std::optional<std::string> message_;
    SteadyClock::time_point createdAt_{};
};

}  // namespace gcm

#endif  // GCM_TUI_TIMED_MESSAGE_H
