#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "logger.hpp"

namespace pathmon {

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;
    size_t max_log_size = 0;
    size_t log_rotate = 1;
    bool json_log = false;
    bool compress_logs = false;
    bool use_syslog = false;
    int syslog_facility = 0;
};

/**
 * @brief Settings for one `pathmon` run, merged from the command line and an
 *        optional configuration file.
 */
struct Options {
    LoggingOptions logging;
    /** Paths to watch: config file entries first, then positional ones. */
    std::vector<std::filesystem::path> paths;
    /** The positional paths alone. */
    std::vector<std::filesystem::path> cli_paths;
    /** YAML or JSON file the options were read from, if any. */
    std::filesystem::path config_file;
    bool resolve_only = false;
    std::chrono::seconds runtime_limit{0};
    bool show_help = false;
    bool print_version = false;
};

/**
 * @brief Parse command line arguments into an @ref Options structure.
 *
 * Values given on the command line override those from the file named by
 * `--config-yaml`/`--config-json`.
 *
 * @throws std::runtime_error on unknown options, invalid values or an
 *         unreadable configuration file.
 */
Options parse_options(int argc, char* argv[]);

/**
 * @brief Re-read the watched paths from @p opts.config_file and combine them
 *        with @ref Options::cli_paths.
 *
 * @throws std::runtime_error when the file cannot be loaded.
 */
std::vector<std::filesystem::path> reload_config_paths(const Options& opts);

} // namespace pathmon

#endif // OPTIONS_HPP
