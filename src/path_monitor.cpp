#include "path_monitor.hpp"

#include <string>
#include <thread>
#include <utility>

#include "change_records.hpp"
#include "link_resolver.hpp"
#include "logger.hpp"

namespace fs = std::filesystem;

namespace pathmon {

void CommandQueue::push_set_paths(std::vector<fs::path> paths) {
    std::lock_guard<std::mutex> lk(mtx_);
    queue_.push_back(Command{false, std::move(paths)});
}

void CommandQueue::push_shutdown() {
    std::lock_guard<std::mutex> lk(mtx_);
    queue_.push_back(Command{true, {}});
}

PendingCommands CommandQueue::drain() {
    std::deque<Command> taken;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        taken.swap(queue_);
    }
    PendingCommands out;
    for (auto& cmd : taken) {
        if (cmd.shutdown) {
            out.shutdown = true;
            out.paths.reset();
            break;
        }
        out.paths = std::move(cmd.paths);
    }
    return out;
}

bool CommandQueue::empty() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return queue_.empty();
}

struct ControlHandle::Shared {
    std::shared_ptr<CompletionPort> port;
    std::shared_ptr<CommandQueue> commands;
    std::shared_ptr<MonitorStatus> status;
    std::thread worker;

    ~Shared() {
        commands->push_shutdown();
        std::error_code ec;
        if (!port->post_wake(ec))
            log_error("Failed to wake path monitor for shutdown", {{"error", ec.message()}});
        if (worker.joinable())
            worker.join();
    }
};

bool ControlHandle::set_paths(const std::vector<fs::path>& paths, std::error_code& ec) {
    if (!shared_) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }
    shared_->commands->push_set_paths(paths);
    return shared_->port->post_wake(ec);
}

bool ControlHandle::shutdown(std::error_code& ec) {
    if (!shared_) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }
    shared_->commands->push_shutdown();
    return shared_->port->post_wake(ec);
}

bool ControlHandle::running() const {
    if (!shared_)
        return false;
    std::lock_guard<std::mutex> lk(shared_->status->mtx);
    return shared_->status->running;
}

std::set<fs::path> ControlHandle::resolved_paths() const {
    if (!shared_)
        return {};
    std::lock_guard<std::mutex> lk(shared_->status->mtx);
    return shared_->status->resolved;
}

PathMonitor::PathMonitor(std::shared_ptr<CompletionPort> port,
                         std::shared_ptr<CommandQueue> commands,
                         std::shared_ptr<MonitorStatus> status, NotificationSender sender,
                         std::vector<fs::path> paths)
    : port_(std::move(port)), commands_(std::move(commands)), status_(std::move(status)),
      sender_(std::move(sender)), paths_(std::move(paths)) {}

PathMonitor::~PathMonitor() = default;

SpawnResult PathMonitor::spawn(const std::vector<fs::path>& paths) {
    std::shared_ptr<CompletionPort> port;
    try {
        port = std::make_shared<CompletionPort>();
    } catch (const std::system_error& e) {
        throw SetupError(e.code(), "failed to create completion port");
    }
    auto commands = std::make_shared<CommandQueue>();
    auto status = std::make_shared<MonitorStatus>();
    auto channel = make_notify_channel();

    std::unique_ptr<PathMonitor> monitor(
        new PathMonitor(port, commands, status, std::move(channel.first), paths));
    monitor->recompute();
    try {
        monitor->reconcile();
    } catch (const fs::filesystem_error& e) {
        throw SetupError(e.code(), "failed to watch " + e.path1().string());
    } catch (const std::system_error& e) {
        throw SetupError(e.code(), "failed to watch paths");
    }
    monitor->publish();
    {
        std::lock_guard<std::mutex> lk(status->mtx);
        status->running = true;
    }

    auto shared = std::make_shared<ControlHandle::Shared>();
    shared->port = port;
    shared->commands = commands;
    shared->status = status;
    try {
        shared->worker = std::thread([m = std::move(monitor)]() { m->run(); });
    } catch (const std::system_error& e) {
        std::lock_guard<std::mutex> lk(status->mtx);
        status->running = false;
        throw SetupError(e.code(), "failed to start path monitor thread");
    }
    log_debug("Path monitor started", {{"paths", std::to_string(paths.size())}});
    return SpawnResult{ControlHandle(std::move(shared)), std::move(channel.second)};
}

void PathMonitor::run() {
    try {
        loop();
    } catch (const std::exception& e) {
        log_error("Path monitor stopped", {{"error", e.what()}});
    }
    log_debug("Shutting down path monitor");
    watches_.clear();
    {
        std::lock_guard<std::mutex> lk(status_->mtx);
        status_->running = false;
    }
    sender_.close();
}

void PathMonitor::loop() {
    for (;;) {
        PendingCommands pending = commands_->drain();
        if (pending.shutdown)
            return;
        if (pending.paths) {
            paths_ = std::move(*pending.paths);
            log_debug("Updating watched paths", {{"count", std::to_string(paths_.size())}});
            recompute();
            reconcile();
            publish();
        }

        Completion completion;
        try {
            completion = port_->wait();
        } catch (const std::system_error& e) {
            log_error("Waiting for directory changes failed", {{"error", e.what()}});
            return;
        }
        if (completion.key == kWakeKey)
            continue;
        handle_completion(completion);
    }
}

void PathMonitor::handle_completion(const Completion& completion) {
    auto it = watches_.find(completion.key);
    if (it == watches_.end()) {
        log_debug("Ignoring completion for a retired watch",
                  {{"key", std::to_string(completion.key)}});
        return;
    }
    DirectoryWatch& watch = *it->second;

    bool relevant = false;
    // Top-level entries renamed under a root watch. Their own watches may
    // still follow the directory a replaced link used to point at.
    std::set<fs::path> replaced;
    const bool root_watch = watch.prefix() == watch.prefix().root_path();
    auto bytes = watch.take_delivery(completion);
    if (bytes) {
        if (*bytes == 0) {
            watch.grow_buffer();
            log_debug("Resized change event buffer as it was too small",
                      {{"path", watch.prefix().string()},
                       {"size", std::to_string(watch.buffer_size())}});
        }
        watch.rearm();
        if (*bytes > 0) {
            try {
                for (const auto& record : watch.parse(*bytes)) {
                    for (const auto& stripped : stripped_) {
                        if (stripped.prefix != watch.prefix() ||
                            !tail_matches(stripped.tail, record.name))
                            continue;
                        relevant = true;
                        if (root_watch && !record.name.empty())
                            replaced.insert(watch.prefix() / *record.name.begin());
                        break;
                    }
                }
            } catch (const ChangeRecordError& e) {
                // Resolve again rather than trust a partial batch.
                log_debug("Malformed change record batch",
                          {{"path", watch.prefix().string()}, {"error", e.what()}});
                relevant = true;
            }
        }
    }

    bool lost = watch.prefix_lost();
    if (lost) {
        log_warning("Lost watch on directory", {{"path", watch.prefix().string()},
                                                {"error", completion.status.message()}});
        watches_.erase(it);
    }
    for (auto w = watches_.begin(); w != watches_.end();) {
        if (!replaced.count(w->second->prefix())) {
            ++w;
            continue;
        }
        log_debug("Reopening watch on replaced directory",
                  {{"path", w->second->prefix().string()}});
        w = watches_.erase(w);
    }
    if (!relevant && !lost)
        return;

    bool changed = recompute();
    if (changed || lost || !replaced.empty())
        reconcile();
    if (changed) {
        publish();
        log_info("Resolved paths changed", {{"count", std::to_string(resolved_.size())}});
        sender_.send();
    }
}

bool PathMonitor::recompute() {
    auto resolved = resolve_all_links_multiple(paths_);
    bool changed = resolved != resolved_;
    resolved_ = std::move(resolved);
    stripped_ = strip_paths(resolved_);
    return changed;
}

void PathMonitor::reconcile() {
    std::map<fs::path, std::set<fs::path>> tails;
    for (const auto& stripped : stripped_)
        tails[stripped.prefix].insert(stripped.tail);

    for (auto it = watches_.begin(); it != watches_.end();) {
        auto wanted = tails.find(it->second->prefix());
        if (wanted == tails.end()) {
            log_debug("Closing watch", {{"path", it->second->prefix().string()}});
            it = watches_.erase(it);
            continue;
        }
        it->second->track(wanted->second);
        tails.erase(wanted);
        ++it;
    }

    for (const auto& [prefix, prefix_tails] : tails) {
        CompletionKey key = next_key_++;
        std::unique_ptr<DirectoryWatch> watch;
        try {
            watch = std::make_unique<DirectoryWatch>(prefix, key, port_);
        } catch (const fs::filesystem_error& e) {
            if (e.code() != std::errc::no_such_file_or_directory)
                throw;
            log_warning("Not monitoring links under directory since it does not exist",
                        {{"path", prefix.string()}});
            continue;
        }
        watch->track(prefix_tails);
        watch->rearm();
        log_debug("Watching directory", {{"path", prefix.string()}, {"key", std::to_string(key)}});
        watches_.emplace(key, std::move(watch));
    }
}

void PathMonitor::publish() {
    std::lock_guard<std::mutex> lk(status_->mtx);
    status_->resolved = resolved_;
}

} // namespace pathmon
