#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <set>

#include "cli_commands.hpp"
#include "link_resolver.hpp"
#include "logger.hpp"
#include "path_monitor.hpp"
#include "time_utils.hpp"

namespace fs = std::filesystem;

namespace pathmon::cli {

namespace {
std::atomic<bool> g_stop{false};
std::atomic<bool> g_reload{false};

void handle_stop_signal(int) { g_stop.store(true); }
#ifndef _WIN32
void handle_reload_signal(int) { g_reload.store(true); }
#endif

void print_resolved(const std::set<fs::path>& resolved) {
    for (const auto& p : resolved)
        std::cout << "  " << p.string() << "\n";
    std::cout << std::flush;
}
} // namespace

void setup_logging(const Options& opts) {
    const LoggingOptions& log = opts.logging;
    set_json_logging(log.json_log);
    set_log_compression(log.compress_logs);
    if (!log.log_file.empty()) {
        init_logger(log.log_file, log.log_level, log.max_log_size, log.log_rotate);
        if (logger_initialized())
            log_info("Program started");
    } else {
        set_log_level(log.log_level);
        set_console_logging(true);
    }
    if (log.use_syslog)
        init_syslog(log.syslog_facility);
}

std::optional<int> handle_resolve_only(const Options& opts) {
    if (!opts.resolve_only)
        return std::nullopt;
    print_resolved(resolve_all_links_multiple(opts.paths));
    return 0;
}

int handle_monitoring_run(const Options& opts) {
    if (opts.paths.empty()) {
        std::cerr << "No paths to monitor\n";
        return 1;
    }

    SpawnResult monitor;
    try {
        monitor = PathMonitor::spawn(opts.paths);
    } catch (const SetupError& e) {
        log_error("Failed to start path monitor", {{"error", e.what()}});
        std::cerr << e.what() << "\n";
        return 1;
    }

    g_stop.store(false);
    g_reload.store(false);
    std::signal(SIGINT, handle_stop_signal);
#ifndef _WIN32
    std::signal(SIGTERM, handle_stop_signal);
    std::signal(SIGHUP, handle_reload_signal);
#endif

    std::cout << timestamp() << " watching\n";
    print_resolved(monitor.handle.resolved_paths());

    const auto start = std::chrono::steady_clock::now();
    int rc = 0;
    while (!g_stop.load()) {
        if (monitor.notifications.recv_for(std::chrono::milliseconds(250))) {
            std::cout << timestamp() << " resolved paths changed\n";
            print_resolved(monitor.handle.resolved_paths());
        } else if (monitor.notifications.finished()) {
            log_error("Path monitor terminated unexpectedly");
            rc = 1;
            break;
        }
        if (g_reload.exchange(false)) {
            try {
                auto paths = reload_config_paths(opts);
                std::error_code ec;
                if (!monitor.handle.set_paths(paths, ec))
                    log_error("Failed to apply reloaded paths", {{"error", ec.message()}});
                else
                    log_info("Reloaded watched paths", {{"count", std::to_string(paths.size())}});
            } catch (const std::runtime_error& e) {
                log_error("Failed to reload config", {{"error", e.what()}});
            }
        }
        if (opts.runtime_limit.count() > 0 &&
            std::chrono::steady_clock::now() - start >= opts.runtime_limit) {
            log_info("Runtime limit reached");
            break;
        }
    }

    std::error_code ec;
    if (!monitor.handle.shutdown(ec))
        log_error("Failed to stop path monitor", {{"error", ec.message()}});
    std::signal(SIGINT, SIG_DFL);
#ifndef _WIN32
    std::signal(SIGTERM, SIG_DFL);
    std::signal(SIGHUP, SIG_DFL);
#endif
    return rc;
}

} // namespace pathmon::cli
