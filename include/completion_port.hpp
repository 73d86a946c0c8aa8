#ifndef COMPLETION_PORT_HPP
#define COMPLETION_PORT_HPP
#include <cstddef>
#include <cstdint>
#include <limits>
#include <system_error>

#include "unique_handle.hpp"

namespace pathmon {

using CompletionKey = std::uintptr_t;

/** Key of a zero-byte completion posted only to wake the waiting thread. */
constexpr CompletionKey kWakeKey = std::numeric_limits<CompletionKey>::max();

/**
 * @brief One completed operation retrieved from a @ref CompletionPort.
 *
 * `has_request` is false for posted wake-ups, which carry no request.
 * `status` is set when the OS reports that the request itself failed.
 */
struct Completion {
    CompletionKey key = kWakeKey;
    std::size_t bytes_transferred = 0;
    bool has_request = false;
    std::error_code status;
};

/**
 * @brief Shared OS object that queues completed asynchronous operations for
 *        one waiting thread.
 *
 * Backed by an I/O completion port on Windows and by epoll plus an eventfd
 * on Linux. Only @ref post_wake may be called from threads other than the
 * waiter.
 */
class CompletionPort {
  public:
    /** @throws std::system_error if the OS object cannot be created. */
    CompletionPort();
    ~CompletionPort() = default;

    CompletionPort(const CompletionPort&) = delete;
    CompletionPort& operator=(const CompletionPort&) = delete;

    /**
     * @brief Route completions of @p handle to this port under @p key.
     *
     * @return `false` with @p ec set on failure.
     */
    bool attach(native_handle_t handle, CompletionKey key, std::error_code& ec);

    /**
     * @brief Block until the next completion arrives.
     *
     * @throws std::system_error when waiting itself fails.
     */
    Completion wait();

    /**
     * @brief Queue a zero-byte completion tagged @ref kWakeKey.
     *
     * @return `false` with @p ec set if the post failed.
     */
    bool post_wake(std::error_code& ec);

  private:
    UniqueHandle port_;
#if !defined(_WIN32)
    UniqueHandle wake_;
#endif
};

} // namespace pathmon

#endif // COMPLETION_PORT_HPP
