#pragma once

#include <optional>

#include "options.hpp"

namespace pathmon::cli {

/**
 * @brief Configure the logger from @a opts.
 *
 * Logs go to the file named by `--log-file`, otherwise to standard error.
 */
void setup_logging(const Options& opts);

/**
 * @brief Handle `--resolve`.
 *
 * Prints every resolved path of @a opts.paths, one per line. Returns the exit
 * code when the flag was given or `std::nullopt` otherwise.
 */
std::optional<int> handle_resolve_only(const Options& opts);

/**
 * @brief Watch @a opts.paths until interrupted or the runtime limit expires.
 *
 * Prints a timestamped line followed by the resolved set each time it
 * changes. SIGHUP re-reads the paths from the config file.
 *
 * @return Process exit code.
 */
int handle_monitoring_run(const Options& opts);

} // namespace pathmon::cli
