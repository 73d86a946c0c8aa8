#ifndef NOTIFY_CHANNEL_HPP
#define NOTIFY_CHANNEL_HPP
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <utility>

namespace pathmon {

namespace detail {
struct ChannelState {
    std::mutex mtx;
    std::condition_variable cv;
    std::size_t pending = 0;
    bool closed = false;
};
} // namespace detail

class NotificationReceiver;

/**
 * @brief Producing end of the "paths changed" stream.
 *
 * Closing (explicitly or on destruction) lets receivers drain what is queued
 * and then observe the end of the stream.
 */
class NotificationSender {
  public:
    NotificationSender() = default;
    ~NotificationSender() { close(); }

    NotificationSender(NotificationSender&& other) noexcept = default;
    NotificationSender& operator=(NotificationSender&& other) noexcept {
        if (this != &other) {
            close();
            state_ = std::move(other.state_);
        }
        return *this;
    }
    NotificationSender(const NotificationSender&) = delete;
    NotificationSender& operator=(const NotificationSender&) = delete;

    /** Queue one notification. Ignored after @ref close. */
    void send();
    void close();

  private:
    friend std::pair<NotificationSender, NotificationReceiver> make_notify_channel();
    explicit NotificationSender(std::shared_ptr<detail::ChannelState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::ChannelState> state_;
};

/**
 * @brief Consuming end of the "paths changed" stream.
 *
 * Notifications carry no payload. Every receive call returns `false` once the
 * sender has closed and the queue is empty.
 */
class NotificationReceiver {
  public:
    NotificationReceiver() = default;

    /** Block until a notification arrives or the stream ends. */
    bool recv();
    /** Take a queued notification without blocking. */
    bool try_recv();
    /** Wait at most @p timeout for a notification. */
    bool recv_for(std::chrono::milliseconds timeout);

    std::size_t pending() const;
    /** Sender closed and nothing left to receive. */
    bool finished() const;

  private:
    friend std::pair<NotificationSender, NotificationReceiver> make_notify_channel();
    explicit NotificationReceiver(std::shared_ptr<detail::ChannelState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::ChannelState> state_;
};

/** Create a connected sender/receiver pair. */
std::pair<NotificationSender, NotificationReceiver> make_notify_channel();

} // namespace pathmon

#endif // NOTIFY_CHANNEL_HPP
