#include "link_resolver.hpp"

#include <iterator>
#include <string>
#include <system_error>
#include <vector>

#include "logger.hpp"
#include "reparse_data.hpp"

#if defined(_WIN32)
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <winioctl.h>
#include "unique_handle.hpp"
#endif

namespace fs = std::filesystem;

namespace pathmon {

namespace {

bool is_missing(const std::error_code& ec) {
    return ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory;
}

#if defined(_WIN32)
std::error_code last_error() {
    return std::error_code(static_cast<int>(GetLastError()), std::system_category());
}

std::wstring long_path(const fs::path& path) {
    std::wstring p = strip_namespace(path).wstring();
    if (p.rfind(L"\\\\?\\", 0) != 0)
        p = L"\\\\?\\" + p;
    return p;
}

// Reads the raw reparse buffer of a path known to carry the reparse bit.
ReparseTarget read_reparse_target(const fs::path& path) {
    // GetFileAttributesW, not fs::status: the latter does not report every
    // attribute bit.
    std::wstring query = long_path(path);
    DWORD attributes = GetFileAttributesW(query.c_str());
    if (attributes == INVALID_FILE_ATTRIBUTES) {
        std::error_code ec = last_error();
        if (is_missing(ec))
            return {};
        throw fs::filesystem_error("GetFileAttributesW failed", path, ec);
    }
    if ((attributes & FILE_ATTRIBUTE_REPARSE_POINT) == 0)
        return {};

    UniqueHandle file(CreateFileW(path.c_str(), GENERIC_READ,
                                  FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr,
                                  OPEN_EXISTING,
                                  FILE_FLAG_OPEN_REPARSE_POINT | FILE_FLAG_BACKUP_SEMANTICS,
                                  nullptr));
    if (!file)
        throw fs::filesystem_error("failed to open reparse point", path, last_error());

    std::vector<std::uint8_t> buffer(kMaxReparseDataSize);
    DWORD returned = 0;
    if (!DeviceIoControl(file.get(), FSCTL_GET_REPARSE_POINT, nullptr, 0, buffer.data(),
                         static_cast<DWORD>(buffer.size()), &returned, nullptr)) {
        throw fs::filesystem_error("FSCTL_GET_REPARSE_POINT failed", path, last_error());
    }
    return decode_reparse_buffer(buffer.data(), returned);
}
#else
ReparseTarget read_reparse_target(const fs::path& path) {
    // Missing paths report file_type::not_found instead of throwing.
    fs::file_status st = fs::symlink_status(path);
    if (st.type() != fs::file_type::symlink)
        return {};
    ReparseTarget result;
    result.kind = ReparseKind::Symlink;
    result.target = fs::read_symlink(path);
    result.relative = !result.target.is_absolute();
    return result;
}
#endif

std::vector<fs::path> resolve_all_links_at(const fs::path& path, std::size_t depth) {
    if (!path.is_absolute()) {
        throw fs::filesystem_error("path must be absolute", path,
                                   std::make_error_code(std::errc::invalid_argument));
    }

    std::vector<fs::path> monitor_paths{path};
    fs::path partial = path.root_path();
    const fs::path relative = path.relative_path();

    for (auto it = relative.begin(); it != relative.end(); ++it) {
        if (it->empty())
            continue;
        partial /= *it;

        std::optional<fs::path> target;
        try {
            target = resolve_link(partial);
        } catch (const fs::filesystem_error& e) {
            if (is_missing(e.code()))
                continue;
            throw;
        }
        if (!target)
            continue;

        if (depth + 1 >= kMaxLinkDepth) {
            throw fs::filesystem_error(
                "too many levels of links", path,
                std::make_error_code(std::errc::too_many_symbolic_link_levels));
        }
        fs::path next = *target;
        for (auto rest = std::next(it); rest != relative.end(); ++rest) {
            if (!rest->empty())
                next /= *rest;
        }
        auto nested = resolve_all_links_at(next, depth + 1);
        monitor_paths.insert(monitor_paths.end(), nested.begin(), nested.end());
        break;
    }
    return monitor_paths;
}

} // namespace

fs::path normalize_path(const fs::path& path) {
    fs::path normal = path.lexically_normal();
    if (!normal.has_filename() && normal.has_relative_path())
        normal = normal.parent_path();
    return normal;
}

std::optional<fs::path> resolve_link(const fs::path& path) {
    ReparseTarget link = read_reparse_target(path);
    switch (link.kind) {
    case ReparseKind::Symlink:
        if (link.relative)
            return normalize_path(path.parent_path() / link.target);
        return strip_namespace(link.target);
    case ReparseKind::MountPoint:
        return strip_namespace(link.target);
    case ReparseKind::Other:
        break;
    }
    return std::nullopt;
}

std::vector<fs::path> resolve_all_links(const fs::path& path) {
    return resolve_all_links_at(path, 0);
}

std::set<fs::path> resolve_all_links_multiple(const std::vector<fs::path>& paths) {
    std::set<fs::path> monitored;
    for (const auto& path : paths) {
        try {
            auto resolved = resolve_all_links(path);
            monitored.insert(resolved.begin(), resolved.end());
        } catch (const std::exception& e) {
            log_error("Failed to identify paths to monitor",
                      {{"path", path.string()}, {"error", e.what()}});
        }
    }
    return monitored;
}

} // namespace pathmon
