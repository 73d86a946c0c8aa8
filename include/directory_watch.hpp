#ifndef DIRECTORY_WATCH_HPP
#define DIRECTORY_WATCH_HPP
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <vector>

#include "change_records.hpp"
#include "completion_port.hpp"
#include "unique_handle.hpp"

namespace pathmon {

/** Initial receive buffer size in bytes. */
constexpr std::size_t kDefaultWatchBufferSize = 2048;

/**
 * @brief One watched directory and its single outstanding
 *        "notify on name change" request.
 *
 * The directory handle is attached to the shared @ref CompletionPort under a
 * fixed key at construction. Completions for that key are handed back via
 * @ref take_delivery, after which the owner re-issues the request with
 * @ref rearm before decoding the batch with @ref parse.
 *
 * On Windows the request covers the whole subtree below the prefix, except
 * for a volume root, which is watched on its own. On Linux inotify watches
 * are placed on the prefix and on each real directory along the tracked
 * tails, and event names are rewritten relative to the prefix.
 */
class DirectoryWatch {
  public:
    /**
     * @brief Open @p prefix and attach it to @p port under @p key.
     *
     * @throws std::filesystem::filesystem_error if the directory cannot be
     *         opened; the code compares equal to
     *         `std::errc::no_such_file_or_directory` when it does not exist.
     * @throws std::system_error if attaching to the port fails.
     */
    DirectoryWatch(std::filesystem::path prefix, CompletionKey key,
                   std::shared_ptr<CompletionPort> port,
                   std::size_t buffer_size = kDefaultWatchBufferSize);
    ~DirectoryWatch();

    DirectoryWatch(const DirectoryWatch&) = delete;
    DirectoryWatch& operator=(const DirectoryWatch&) = delete;

    const std::filesystem::path& prefix() const { return prefix_; }
    CompletionKey key() const { return key_; }
    std::size_t buffer_size() const;

    /**
     * @brief Replace the tails (relative to the prefix) this watch follows.
     *
     * Does not issue a new request.
     *
     * @throws std::system_error if a directory along a tail cannot be watched.
     */
    void track(const std::set<std::filesystem::path>& tails);

    /**
     * @brief Issue the next change-notification request.
     *
     * @throws std::system_error if the request cannot be issued.
     */
    void rearm();

    /**
     * @brief Claim the bytes delivered by @p completion.
     *
     * @return Number of bytes now in the receive buffer, zero when the batch
     *         did not fit, or `std::nullopt` when nothing was delivered.
     */
    std::optional<std::size_t> take_delivery(const Completion& completion);

    /** Double the receive buffer. */
    void grow_buffer();

    /**
     * @brief Decode the first @p bytes of the receive buffer.
     *
     * Record names are relative to @ref prefix.
     */
    std::vector<ChangeRecord> parse(std::size_t bytes);

    /** The watched directory itself was removed or became unreadable. */
    bool prefix_lost() const { return prefix_lost_; }

#if !defined(_WIN32)
    /** Number of directories currently holding an inotify watch. */
    std::size_t watched_directories() const { return dirs_.size(); }
#endif

  private:
    std::filesystem::path prefix_;
    CompletionKey key_;
    std::shared_ptr<CompletionPort> port_;
    bool prefix_lost_ = false;
#if defined(_WIN32)
    UniqueHandle dir_;
    OVERLAPPED overlapped_{};
    bool pending_ = false;
    // The kernel fills write_buffer_ while read_buffer_ holds the batch
    // being decoded.
    std::vector<DWORD> read_buffer_;
    std::vector<DWORD> write_buffer_;
#else
    void watch_tails();

    UniqueHandle inotify_;
    int prefix_wd_ = -1;
    std::map<int, std::filesystem::path> dirs_;
    std::set<std::filesystem::path> tails_;
    std::vector<std::uint8_t> buffer_;
#endif
};

} // namespace pathmon

#endif // DIRECTORY_WATCH_HPP
