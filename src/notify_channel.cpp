#include "notify_channel.hpp"

namespace pathmon {

std::pair<NotificationSender, NotificationReceiver> make_notify_channel() {
    auto state = std::make_shared<detail::ChannelState>();
    return {NotificationSender(state), NotificationReceiver(state)};
}

void NotificationSender::send() {
    if (!state_)
        return;
    {
        std::lock_guard<std::mutex> lk(state_->mtx);
        if (state_->closed)
            return;
        ++state_->pending;
    }
    state_->cv.notify_one();
}

void NotificationSender::close() {
    if (!state_)
        return;
    {
        std::lock_guard<std::mutex> lk(state_->mtx);
        state_->closed = true;
    }
    state_->cv.notify_all();
    state_.reset();
}

bool NotificationReceiver::recv() {
    if (!state_)
        return false;
    std::unique_lock<std::mutex> lk(state_->mtx);
    state_->cv.wait(lk, [this] { return state_->pending > 0 || state_->closed; });
    if (state_->pending == 0)
        return false;
    --state_->pending;
    return true;
}

bool NotificationReceiver::try_recv() {
    if (!state_)
        return false;
    std::lock_guard<std::mutex> lk(state_->mtx);
    if (state_->pending == 0)
        return false;
    --state_->pending;
    return true;
}

bool NotificationReceiver::recv_for(std::chrono::milliseconds timeout) {
    if (!state_)
        return false;
    std::unique_lock<std::mutex> lk(state_->mtx);
    state_->cv.wait_for(lk, timeout, [this] { return state_->pending > 0 || state_->closed; });
    if (state_->pending == 0)
        return false;
    --state_->pending;
    return true;
}

std::size_t NotificationReceiver::pending() const {
    if (!state_)
        return 0;
    std::lock_guard<std::mutex> lk(state_->mtx);
    return state_->pending;
}

bool NotificationReceiver::finished() const {
    if (!state_)
        return true;
    std::lock_guard<std::mutex> lk(state_->mtx);
    return state_->closed && state_->pending == 0;
}

} // namespace pathmon
