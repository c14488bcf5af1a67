#ifndef GCM_TUI_ACTION_CHANNEL_H
#define GCM_TUI_ACTION_CHANNEL_H

#include "action.h"
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

namespace gcm {

namespace detail {
struct ChannelState {
    std::mutex mutex;
    std::deque<Action> queue;
    bool receiverAlive = true;
};
}  // namespace detail

// Producer half of the action channel. Cheap to copy; every component
// holds one. A default-constructed sender is disconnected.
class ActionSender {
public:
    ActionSender() = default;

    // Enqueue an action. Returns false only when the receiver is gone
    // (or the sender was never connected).
    bool send(Action action) const;

    bool connected() const { return static_cast<bool>(state_); }

private:
    friend class ActionChannel;
    explicit ActionSender(std::shared_ptr<detail::ChannelState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::ChannelState> state_;
};

// Unbounded multi-producer, single-consumer queue of actions.
// The channel object itself is the receiving half.
class ActionChannel {
public:
    ActionChannel();
    ~ActionChannel();

    ActionChannel(const ActionChannel&) = delete;
    ActionChannel& operator=(const ActionChannel&) = delete;

    ActionSender sender() const { return ActionSender(state_); }

    // Non-blocking receive
    std::optional<Action> tryRecv();

    // Number of queued actions at the time of the call
    size_t pending() const;

private:
    std::shared_ptr<detail::ChannelState> state_;
};

}  // namespace gcm

#endif  // GCM_TUI_ACTION_CHANNEL_H
