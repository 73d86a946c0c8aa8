#ifndef LINK_RESOLVER_HPP
#define LINK_RESOLVER_HPP
#include <cstddef>
#include <filesystem>
#include <optional>
#include <set>
#include <vector>

namespace pathmon {

/** Recursion limit for chained redirections, matching `SYMLOOP_MAX`. */
constexpr std::size_t kMaxLinkDepth = 40;

/**
 * @brief Lexically normalize an absolute path.
 *
 * Removes `.` and `..` segments and a trailing separator without consulting
 * the filesystem.
 */
std::filesystem::path normalize_path(const std::filesystem::path& path);

/**
 * @brief Return the target of a redirecting link as an absolute path.
 *
 * Only symbolic links and mount points (junctions) are followed. The link
 * itself is inspected, never its target.
 *
 * @param path Path of the candidate link.
 * @return Absolute target, or `std::nullopt` when @p path is not a link we
 *         resolve.
 * @throws std::filesystem::filesystem_error when the OS query fails.
 * @throws ReparseDataError when the redirection buffer is malformed.
 */
std::optional<std::filesystem::path> resolve_link(const std::filesystem::path& path);

/**
 * @brief Return @p path followed by the real location of every redirection
 *        reached along its ancestors.
 *
 * The walk stops at the first redirecting component and continues in the
 * link's target, so each level contributes at most one redirection.
 * Components that do not exist are skipped.
 *
 * @throws std::filesystem::filesystem_error for relative paths, link cycles
 *         and OS failures other than "not found".
 */
std::vector<std::filesystem::path> resolve_all_links(const std::filesystem::path& path);

/**
 * @brief Resolve every path in @p paths, skipping (and logging) the ones that
 *        fail.
 */
std::set<std::filesystem::path>
resolve_all_links_multiple(const std::vector<std::filesystem::path>& paths);

} // namespace pathmon

#endif // LINK_RESOLVER_HPP
