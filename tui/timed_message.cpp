#include "timed_message.h"

namespace gcm {

void TimedMessage::set(std::string message, SteadyClock::time_point now) {
    message_ = std::move(message);
    createdAt_ = now;
}

bool TimedMessage::expireIfStale(SteadyClock::time_point now) {
    if (message_ && now - createdAt_ > duration_) {
        message_.reset();
        return true;
    }
    return false;
}

const std::string& TimedMessage::text() const {
    static const std::string empty;
    return message_ ? *message_ : empty;
}

}  // namespace gcm
