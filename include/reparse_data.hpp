#ifndef REPARSE_DATA_HPP
#define REPARSE_DATA_HPP
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace pathmon {

constexpr std::uint32_t kReparseTagMountPoint = 0xA0000003u;
constexpr std::uint32_t kReparseTagSymlink = 0xA000000Cu;
constexpr std::uint32_t kSymlinkFlagRelative = 0x00000001u;

/** Largest buffer `FSCTL_GET_REPARSE_POINT` can return (16 KiB). */
constexpr std::size_t kMaxReparseDataSize = 16 * 1024;

/**
 * @brief Raised when a reparse buffer is shorter than its own header or
 *        names a range outside itself.
 */
class ReparseDataError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

enum class ReparseKind { Symlink, MountPoint, Other };

/**
 * @brief Decoded redirection carried by a reparse point.
 *
 * `target` is the substitute name exactly as stored in the buffer. It is
 * empty for `ReparseKind::Other`.
 */
struct ReparseTarget {
    ReparseKind kind = ReparseKind::Other;
    std::uint32_t tag = 0;
    std::filesystem::path target;
    bool relative = false;
};

/**
 * @brief Decode a `REPARSE_DATA_BUFFER` as returned by
 *        `FSCTL_GET_REPARSE_POINT`.
 *
 * Symbolic-link buffers carry a flags word before the path buffer; mount
 * point buffers do not. Every offset and length is checked against @p size.
 *
 * @param data Pointer to the raw buffer.
 * @param size Number of valid bytes at @p data.
 * @throws ReparseDataError on a truncated or inconsistent buffer.
 */
ReparseTarget decode_reparse_buffer(const std::uint8_t* data, std::size_t size);

/**
 * @brief Remove the NT `\??\` (DosDevices) prefix from a link target.
 *
 * Paths without the prefix are returned unchanged.
 */
std::filesystem::path strip_namespace(const std::filesystem::path& path);

/** Decode @p size bytes of UTF-16LE into a path. */
std::filesystem::path path_from_utf16le(const std::uint8_t* data, std::size_t size);

} // namespace pathmon

#endif // REPARSE_DATA_HPP
