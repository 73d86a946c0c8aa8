#ifndef PATH_MONITOR_HPP
#define PATH_MONITOR_HPP
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <system_error>
#include <vector>

#include "completion_port.hpp"
#include "directory_watch.hpp"
#include "notify_channel.hpp"
#include "stripped_path.hpp"

namespace pathmon {

/** Thrown by @ref PathMonitor::spawn when nothing could be started. */
class SetupError : public std::system_error {
  public:
    using std::system_error::system_error;
};

/** Commands collected by one non-blocking @ref CommandQueue::drain. */
struct PendingCommands {
    bool shutdown = false;
    /** Latest path list queued, if any. */
    std::optional<std::vector<std::filesystem::path>> paths;
};

/**
 * @brief Multi-producer queue of control commands for the monitor thread.
 *
 * Draining collapses the queue: a queued shutdown discards every path
 * update, and only the most recent path update is kept otherwise.
 */
class CommandQueue {
  public:
    void push_set_paths(std::vector<std::filesystem::path> paths);
    void push_shutdown();
    PendingCommands drain();
    bool empty() const;

  private:
    struct Command {
        bool shutdown = false;
        std::vector<std::filesystem::path> paths;
    };
    mutable std::mutex mtx_;
    std::deque<Command> queue_;
};

/** State shared between the monitor thread and its control handles. */
struct MonitorStatus {
    mutable std::mutex mtx;
    bool running = false;
    std::set<std::filesystem::path> resolved;
};

/**
 * @brief Caller-facing control over a running monitor.
 *
 * Copies share the same monitor. Destroying the last copy asks the monitor to
 * shut down and waits for its thread to finish.
 */
class ControlHandle {
  public:
    ControlHandle() = default;

    /**
     * @brief Replace the watched paths.
     *
     * Returns once the monitor has been woken; the effect is observed only
     * through the notification stream.
     *
     * @return `false` with @p ec set if the wake could not be posted.
     */
    bool set_paths(const std::vector<std::filesystem::path>& paths, std::error_code& ec);

    /** @brief Ask the monitor to stop. Same contract as @ref set_paths. */
    bool shutdown(std::error_code& ec);

    /** Whether the monitor thread is still processing events. */
    bool running() const;

    /** Snapshot of the resolved path set the monitor currently watches. */
    std::set<std::filesystem::path> resolved_paths() const;

  private:
    friend class PathMonitor;
    struct Shared;
    explicit ControlHandle(std::shared_ptr<Shared> shared) : shared_(std::move(shared)) {}

    std::shared_ptr<Shared> shared_;
};

struct SpawnResult {
    ControlHandle handle;
    NotificationReceiver notifications;
};

/**
 * @brief Single-threaded monitor that keeps the real locations of a set of
 *        paths up to date.
 *
 * Every link along the ancestry of each watched path is resolved, and the
 * directories that could invalidate that resolution are watched. Whenever the
 * resolved set changes one notification is emitted.
 */
class PathMonitor {
  public:
    /**
     * @brief Resolve @p paths, open the initial watches and start the monitor
     *        thread.
     *
     * @throws SetupError if the completion port cannot be created or a watch
     *         fails to open for a reason other than "not found".
     */
    static SpawnResult spawn(const std::vector<std::filesystem::path>& paths);

    ~PathMonitor();
    PathMonitor(const PathMonitor&) = delete;
    PathMonitor& operator=(const PathMonitor&) = delete;

  private:
    PathMonitor(std::shared_ptr<CompletionPort> port, std::shared_ptr<CommandQueue> commands,
                std::shared_ptr<MonitorStatus> status, NotificationSender sender,
                std::vector<std::filesystem::path> paths);

    void run();
    void loop();
    void handle_completion(const Completion& completion);
    bool recompute();
    void reconcile();
    void publish();

    std::shared_ptr<CompletionPort> port_;
    std::shared_ptr<CommandQueue> commands_;
    std::shared_ptr<MonitorStatus> status_;
    NotificationSender sender_;
    std::vector<std::filesystem::path> paths_;
    std::set<std::filesystem::path> resolved_;
    std::set<StrippedPath> stripped_;
    std::map<CompletionKey, std::unique_ptr<DirectoryWatch>> watches_;
    CompletionKey next_key_ = 0;
};

} // namespace pathmon

#endif // PATH_MONITOR_HPP
