#include "directory_watch.hpp"

#include <algorithm>
#include <cerrno>
#include <iterator>
#include <string>
#include <system_error>
#include <utility>

#include "logger.hpp"

#if !defined(_WIN32)
#include <sys/inotify.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace pathmon {

namespace {
std::error_code last_os_error() {
#if defined(_WIN32)
    return std::error_code(static_cast<int>(GetLastError()), std::system_category());
#else
    return std::error_code(errno, std::system_category());
#endif
}

#if !defined(_WIN32)
constexpr std::uint32_t kNameEvents = IN_CREATE | IN_DELETE | IN_MOVED_FROM | IN_MOVED_TO;
constexpr std::uint32_t kPrefixMask = kNameEvents | IN_DELETE_SELF | IN_MOVE_SELF;
// Intermediate directories are watched only when they are real directories;
// a link at that level is the change being looked for, not something to
// follow.
constexpr std::uint32_t kChainMask =
    kNameEvents | IN_DELETE_SELF | IN_MOVE_SELF | IN_ONLYDIR | IN_DONT_FOLLOW;
#endif
} // namespace

#if defined(_WIN32)

DirectoryWatch::DirectoryWatch(fs::path prefix, CompletionKey key,
                               std::shared_ptr<CompletionPort> port, std::size_t buffer_size)
    : prefix_(std::move(prefix)), key_(key), port_(std::move(port)),
      read_buffer_((buffer_size + sizeof(DWORD) - 1) / sizeof(DWORD)),
      write_buffer_(read_buffer_.size()) {
    dir_.reset(CreateFileW(prefix_.c_str(), FILE_LIST_DIRECTORY,
                           FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr,
                           OPEN_EXISTING, FILE_FLAG_BACKUP_SEMANTICS | FILE_FLAG_OVERLAPPED,
                           nullptr));
    if (!dir_)
        throw fs::filesystem_error("failed to open directory", prefix_, last_os_error());
    std::error_code ec;
    if (!port_->attach(dir_.get(), key_, ec))
        throw std::system_error(ec, "failed to attach directory to completion port");
}

DirectoryWatch::~DirectoryWatch() {
    if (pending_) {
        // The kernel owns the buffer until the cancelled request completes.
        DWORD ignored = 0;
        if (CancelIoEx(dir_.get(), &overlapped_) || GetLastError() != ERROR_NOT_FOUND)
            GetOverlappedResult(dir_.get(), &overlapped_, &ignored, TRUE);
    }
}

std::size_t DirectoryWatch::buffer_size() const {
    return write_buffer_.size() * sizeof(DWORD);
}

void DirectoryWatch::track(const std::set<fs::path>&) {}

void DirectoryWatch::rearm() {
    overlapped_ = OVERLAPPED{};
    // A volume root only guards its top-level entries.
    const BOOL subtree = prefix_ != prefix_.root_path() ? TRUE : FALSE;
    if (!ReadDirectoryChangesW(dir_.get(), write_buffer_.data(),
                               static_cast<DWORD>(buffer_size()), subtree,
                               FILE_NOTIFY_CHANGE_FILE_NAME | FILE_NOTIFY_CHANGE_DIR_NAME,
                               nullptr, &overlapped_, nullptr)) {
        throw std::system_error(last_os_error(), "ReadDirectoryChangesW failed");
    }
    pending_ = true;
}

std::optional<std::size_t> DirectoryWatch::take_delivery(const Completion& completion) {
    if (!completion.has_request)
        return std::nullopt;
    pending_ = false;
    if (completion.status) {
        prefix_lost_ = true;
        return std::nullopt;
    }
    // The next request must not write over the batch about to be decoded.
    read_buffer_.swap(write_buffer_);
    return completion.bytes_transferred;
}

void DirectoryWatch::grow_buffer() {
    write_buffer_.resize(write_buffer_.size() * 2);
    read_buffer_.resize(write_buffer_.size());
}

std::vector<ChangeRecord> DirectoryWatch::parse(std::size_t bytes) {
    return decode_notify_information(reinterpret_cast<const std::uint8_t*>(read_buffer_.data()),
                                     std::min(bytes, read_buffer_.size() * sizeof(DWORD)));
}

#else

DirectoryWatch::DirectoryWatch(fs::path prefix, CompletionKey key,
                               std::shared_ptr<CompletionPort> port, std::size_t buffer_size)
    : prefix_(std::move(prefix)), key_(key), port_(std::move(port)), buffer_(buffer_size) {
    inotify_.reset(inotify_init1(IN_NONBLOCK | IN_CLOEXEC));
    if (!inotify_)
        throw std::system_error(last_os_error(), "inotify_init1 failed");
    prefix_wd_ = inotify_add_watch(inotify_.get(), prefix_.c_str(), kPrefixMask);
    if (prefix_wd_ < 0)
        throw fs::filesystem_error("failed to watch directory", prefix_, last_os_error());
    dirs_[prefix_wd_] = fs::path();
    std::error_code ec;
    if (!port_->attach(inotify_.get(), key_, ec))
        throw std::system_error(ec, "failed to attach inotify descriptor to epoll");
}

// Closing the inotify descriptor drops its watches and its epoll
// registration.
DirectoryWatch::~DirectoryWatch() = default;

std::size_t DirectoryWatch::buffer_size() const { return buffer_.size(); }

void DirectoryWatch::track(const std::set<fs::path>& tails) {
    tails_ = tails;
    watch_tails();
}

// inotify has no request to re-issue; re-arming only picks up directories
// that appeared along the tails since the last pass.
void DirectoryWatch::rearm() { watch_tails(); }

void DirectoryWatch::watch_tails() {
    std::set<int> reached{prefix_wd_};
    for (const auto& tail : tails_) {
        fs::path dir = prefix_;
        fs::path rel;
        for (auto it = tail.begin(); it != tail.end() && std::next(it) != tail.end(); ++it) {
            if (it->empty())
                continue;
            dir /= *it;
            rel /= *it;
            std::error_code ec;
            if (fs::symlink_status(dir, ec).type() != fs::file_type::directory)
                break;
            int wd = inotify_add_watch(inotify_.get(), dir.c_str(), kChainMask);
            if (wd < 0) {
                if (errno == ENOENT || errno == ENOTDIR)
                    break;
                throw std::system_error(last_os_error(), "inotify_add_watch failed for " +
                                                             dir.string());
            }
            dirs_[wd] = rel;
            reached.insert(wd);
        }
    }

    // Directories no tail passes through any more.
    for (auto it = dirs_.begin(); it != dirs_.end();) {
        if (reached.count(it->first)) {
            ++it;
            continue;
        }
        if (inotify_rm_watch(inotify_.get(), it->first) != 0)
            log_debug("inotify_rm_watch failed", {{"path", (prefix_ / it->second).string()},
                                                  {"error", last_os_error().message()}});
        it = dirs_.erase(it);
    }
}

std::optional<std::size_t> DirectoryWatch::take_delivery(const Completion& completion) {
    if (!completion.has_request)
        return std::nullopt;
    if (completion.status) {
        prefix_lost_ = true;
        return std::nullopt;
    }
    ssize_t n = read(inotify_.get(), buffer_.data(), buffer_.size());
    if (n > 0)
        return static_cast<std::size_t>(n);
    if (n < 0 && errno == EINVAL)
        return 0; // next event does not fit
    if (n < 0 && errno != EAGAIN && errno != EINTR)
        throw std::system_error(last_os_error(), "failed to read inotify events");
    return std::nullopt;
}

void DirectoryWatch::grow_buffer() { buffer_.resize(buffer_.size() * 2); }

std::vector<ChangeRecord> DirectoryWatch::parse(std::size_t bytes) {
    std::vector<ChangeRecord> out;
    for (auto& record : decode_inotify_events(buffer_.data(), std::min(bytes, buffer_.size()))) {
        if (record.action & IN_Q_OVERFLOW) {
            // Events were dropped; an empty name matches every tail.
            log_debug("inotify queue overflow", {{"prefix", prefix_.string()}});
            out.push_back(ChangeRecord{record.action, record.watch, fs::path()});
            continue;
        }
        auto dir = dirs_.find(record.watch);
        if (dir == dirs_.end())
            continue;
        if (record.action & IN_IGNORED) {
            if (record.watch == prefix_wd_)
                prefix_lost_ = true;
            dirs_.erase(dir);
            continue;
        }
        ChangeRecord rewritten{record.action, record.watch, dir->second};
        if (!record.name.empty())
            rewritten.name /= record.name;
        if (record.action & IN_MOVE_SELF) {
            // The watch follows the inode, so the old relative path no longer
            // describes it.
            if (record.watch == prefix_wd_)
                prefix_lost_ = true;
            if (inotify_rm_watch(inotify_.get(), record.watch) != 0)
                log_debug("inotify_rm_watch failed", {{"error", last_os_error().message()}});
            dirs_.erase(dir);
        }
        out.push_back(std::move(rewritten));
    }
    return out;
}

#endif

} // namespace pathmon
