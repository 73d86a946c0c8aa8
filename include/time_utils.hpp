#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <chrono>
#include <string>

/**
 * @brief Format a point in time as local `YYYY-MM-DD HH:MM:SS.mmm`.
 */
std::string format_timestamp(std::chrono::system_clock::time_point when);

/**
 * @brief Get the current local time formatted as `YYYY-MM-DD HH:MM:SS.mmm`.
 */
std::string timestamp();

#endif // TIME_UTILS_HPP
