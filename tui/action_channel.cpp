#include "action_channel.h"

namespace gcm {

bool ActionSender::send(Action action) const {
    if (!state_) return false;
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (!state_->receiverAlive) return false;
    state_->queue.push_back(std::move(action));
    return true;
}

ActionChannel::ActionChannel()
    : state_(std::make_shared<detail::ChannelState>()) {}

ActionChannel::~ActionChannel() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->receiverAlive = false;
    state_->queue.clear();
}

std::optional<Action> ActionChannel::tryRecv() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->queue.empty()) return std::nullopt;
    Action action = std::move(state_->queue.front());
    state_->queue.pop_front();
    return action;
}

size_t ActionChannel::pending() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->queue.size();
}

}  // namespace gcm
