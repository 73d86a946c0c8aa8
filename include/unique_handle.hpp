#ifndef UNIQUE_HANDLE_HPP
#define UNIQUE_HANDLE_HPP

#if defined(_WIN32)
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace pathmon {

#if defined(_WIN32)
using native_handle_t = HANDLE;
#else
using native_handle_t = int;
#endif

/**
 * @brief RAII owner of a native OS handle.
 *
 * Wraps a Windows `HANDLE` or a POSIX file descriptor and closes it on
 * destruction. Move-only.
 */
class UniqueHandle {
  public:
#if defined(_WIN32)
    static inline const native_handle_t invalid_value = INVALID_HANDLE_VALUE;
#else
    static constexpr native_handle_t invalid_value = -1;
#endif

    UniqueHandle() = default;
    explicit UniqueHandle(native_handle_t h) : handle_(h) {}
    ~UniqueHandle() { reset(); }

    UniqueHandle(UniqueHandle&& other) noexcept : handle_(other.release()) {}
    UniqueHandle& operator=(UniqueHandle&& other) noexcept {
        if (this != &other)
            reset(other.release());
        return *this;
    }
    UniqueHandle(const UniqueHandle&) = delete;
    UniqueHandle& operator=(const UniqueHandle&) = delete;

    native_handle_t get() const { return handle_; }
    bool valid() const {
#if defined(_WIN32)
        return handle_ != INVALID_HANDLE_VALUE && handle_ != nullptr;
#else
        return handle_ >= 0;
#endif
    }
    explicit operator bool() const { return valid(); }

    native_handle_t release() {
        native_handle_t h = handle_;
        handle_ = invalid_value;
        return h;
    }

    void reset(native_handle_t h = invalid_value) {
        if (valid()) {
#if defined(_WIN32)
            CloseHandle(handle_);
#else
            ::close(handle_);
#endif
        }
        handle_ = h;
    }

  private:
    native_handle_t handle_ = invalid_value;
};

} // namespace pathmon

#endif // UNIQUE_HANDLE_HPP
