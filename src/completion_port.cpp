#include "completion_port.hpp"

#include <cerrno>

#if defined(_WIN32)
#include <windows.h>
#else
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>
#endif

namespace pathmon {

namespace {
std::error_code last_os_error() {
#if defined(_WIN32)
    return std::error_code(static_cast<int>(GetLastError()), std::system_category());
#else
    return std::error_code(errno, std::system_category());
#endif
}
} // namespace

#if defined(_WIN32)

CompletionPort::CompletionPort() {
    // Zero concurrent threads means "number of processors"; only one thread
    // ever waits here.
    port_.reset(CreateIoCompletionPort(INVALID_HANDLE_VALUE, nullptr, 0, 0));
    if (!port_)
        throw std::system_error(last_os_error(), "CreateIoCompletionPort failed");
}

bool CompletionPort::attach(native_handle_t handle, CompletionKey key, std::error_code& ec) {
    if (CreateIoCompletionPort(handle, port_.get(), static_cast<ULONG_PTR>(key), 0) == nullptr) {
        ec = last_os_error();
        return false;
    }
    ec.clear();
    return true;
}

Completion CompletionPort::wait() {
    DWORD bytes = 0;
    ULONG_PTR key = 0;
    OVERLAPPED* overlapped = nullptr;
    Completion result;
    if (!GetQueuedCompletionStatus(port_.get(), &bytes, &key, &overlapped, INFINITE)) {
        // A null OVERLAPPED means the wait failed; otherwise the dequeued
        // request completed with an error.
        if (overlapped == nullptr)
            throw std::system_error(last_os_error(), "GetQueuedCompletionStatus failed");
        result.status = last_os_error();
    }
    result.key = static_cast<CompletionKey>(key);
    result.bytes_transferred = bytes;
    result.has_request = overlapped != nullptr;
    return result;
}

bool CompletionPort::post_wake(std::error_code& ec) {
    if (!PostQueuedCompletionStatus(port_.get(), 0, static_cast<ULONG_PTR>(kWakeKey), nullptr)) {
        ec = last_os_error();
        return false;
    }
    ec.clear();
    return true;
}

#else

CompletionPort::CompletionPort() {
    port_.reset(epoll_create1(EPOLL_CLOEXEC));
    if (!port_)
        throw std::system_error(last_os_error(), "epoll_create1 failed");
    wake_.reset(eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC));
    if (!wake_)
        throw std::system_error(last_os_error(), "eventfd failed");
    std::error_code ec;
    if (!attach(wake_.get(), kWakeKey, ec))
        throw std::system_error(ec, "failed to register wake descriptor");
}

bool CompletionPort::attach(native_handle_t handle, CompletionKey key, std::error_code& ec) {
    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.u64 = key;
    if (epoll_ctl(port_.get(), EPOLL_CTL_ADD, handle, &ev) != 0) {
        ec = last_os_error();
        return false;
    }
    ec.clear();
    return true;
}

Completion CompletionPort::wait() {
    epoll_event ev{};
    int n = 0;
    do {
        n = epoll_wait(port_.get(), &ev, 1, -1);
    } while (n < 0 && errno == EINTR);
    if (n < 0)
        throw std::system_error(last_os_error(), "epoll_wait failed");

    Completion result;
    result.key = static_cast<CompletionKey>(ev.data.u64);
    if (result.key == kWakeKey) {
        // Reset the counter so the level-triggered wake does not fire again.
        eventfd_t value = 0;
        if (eventfd_read(wake_.get(), &value) != 0 && errno != EAGAIN)
            throw std::system_error(last_os_error(), "eventfd_read failed");
        return result;
    }
    result.has_request = true;
    if (ev.events & (EPOLLERR | EPOLLHUP))
        result.status = std::make_error_code(std::errc::io_error);
    return result;
}

bool CompletionPort::post_wake(std::error_code& ec) {
    if (eventfd_write(wake_.get(), 1) != 0) {
        ec = last_os_error();
        return false;
    }
    ec.clear();
    return true;
}

#endif

} // namespace pathmon
