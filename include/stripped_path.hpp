#ifndef STRIPPED_PATH_HPP
#define STRIPPED_PATH_HPP
#include <filesystem>
#include <set>
#include <tuple>

namespace pathmon {

/**
 * @brief A resolved path split into the directory that is watched and the
 *        remainder that change-record names are compared against.
 *
 * `prefix` is the volume root joined with the first component below it, or
 * the bare root for single-component paths. `tail` is relative to `prefix`.
 */
struct StrippedPath {
    std::filesystem::path prefix;
    std::filesystem::path tail;

    bool operator<(const StrippedPath& other) const {
        return std::tie(prefix, tail) < std::tie(other.prefix, other.tail);
    }
    bool operator==(const StrippedPath& other) const {
        return prefix == other.prefix && tail == other.tail;
    }
};

/**
 * @brief Split @p path into prefix and tail.
 *
 * @throws std::invalid_argument if @p path has no root.
 */
StrippedPath strip_path(const std::filesystem::path& path);

/**
 * @brief Split every path in @p resolved, skipping those without a root.
 *
 * Each path below a top-level directory also yields a root entry whose tail
 * is that directory, so replacing a top-level link is seen by a
 * non-recursive watch on the root.
 */
std::set<StrippedPath> strip_paths(const std::set<std::filesystem::path>& resolved);

/**
 * @brief Whether a change-record name (relative to the watched prefix) is a
 *        textual prefix of @p tail.
 *
 * The comparison is on the native string, so `A/B` also matches a tail
 * starting with `A/Bc`.
 */
bool tail_matches(const std::filesystem::path& tail, const std::filesystem::path& name);

} // namespace pathmon

#endif // STRIPPED_PATH_HPP
