#include "stripped_path.hpp"

#include <iterator>
#include <stdexcept>
#include <utility>

#include "logger.hpp"

namespace fs = std::filesystem;

namespace pathmon {

StrippedPath strip_path(const fs::path& path) {
    if (!path.has_root_path())
        throw std::invalid_argument("path is missing root: " + path.string());

    StrippedPath out;
    out.prefix = path.root_path();
    const fs::path relative = path.relative_path();
    auto it = relative.begin();
    while (it != relative.end() && it->empty())
        ++it;
    if (it == relative.end())
        return out;

    auto next = std::next(it);
    if (next == relative.end() || (next->empty() && std::next(next) == relative.end())) {
        // Single component: watch the root itself.
        out.tail = *it;
        return out;
    }
    out.prefix /= *it;
    for (++it; it != relative.end(); ++it) {
        if (!it->empty())
            out.tail /= *it;
    }
    return out;
}

std::set<StrippedPath> strip_paths(const std::set<fs::path>& resolved) {
    std::set<StrippedPath> stripped;
    for (const auto& path : resolved) {
        try {
            StrippedPath split = strip_path(path);
            if (split.prefix != split.prefix.root_path()) {
                // The top-level directory may itself be a link, which only
                // the root sees being replaced.
                stripped.insert(StrippedPath{split.prefix.root_path(),
                                             split.prefix.relative_path()});
            }
            stripped.insert(std::move(split));
        } catch (const std::invalid_argument&) {
            log_debug("Not watching path without root", {{"path", path.string()}});
        }
    }
    return stripped;
}

bool tail_matches(const fs::path& tail, const fs::path& name) {
    const auto& t = tail.native();
    const auto& n = name.native();
    return t.compare(0, n.size(), n) == 0;
}

} // namespace pathmon
