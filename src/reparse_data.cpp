#include "reparse_data.hpp"

#include <string>

#include "byte_reader.hpp"

namespace pathmon {

namespace {

// tag, data_length, reserved, then four u16 name fields.
constexpr std::size_t kReparseHeaderSize = 8;
constexpr std::size_t kNameFieldsSize = 8;
constexpr std::size_t kSymlinkFlagsSize = 4;

} // namespace

std::filesystem::path path_from_utf16le(const std::uint8_t* data, std::size_t size) {
    std::u16string out;
    out.reserve(size / 2);
    for (std::size_t i = 0; i + 1 < size; i += 2)
        out.push_back(static_cast<char16_t>(data[i] | (data[i + 1] << 8)));
    return std::filesystem::path(out);
}

ReparseTarget decode_reparse_buffer(const std::uint8_t* data, std::size_t size) {
    if (size < kReparseHeaderSize)
        throw ReparseDataError("reparse buffer shorter than its header");

    ReparseTarget result;
    result.tag = read_le32(data);
    std::size_t data_length = read_le16(data + 4);
    if (kReparseHeaderSize + data_length > size)
        throw ReparseDataError("reparse data length exceeds buffer");

    std::size_t path_buffer = kReparseHeaderSize + kNameFieldsSize;
    switch (result.tag) {
    case kReparseTagSymlink:
        result.kind = ReparseKind::Symlink;
        path_buffer += kSymlinkFlagsSize;
        break;
    case kReparseTagMountPoint:
        result.kind = ReparseKind::MountPoint;
        break;
    default:
        return result;
    }
    if (path_buffer > size)
        throw ReparseDataError("reparse buffer truncated before path buffer");

    std::size_t name_offset = read_le16(data + kReparseHeaderSize);
    std::size_t name_length = read_le16(data + kReparseHeaderSize + 2);
    if (name_length % 2 != 0)
        throw ReparseDataError("substitute name has odd byte length");
    if (path_buffer + name_offset + name_length > size)
        throw ReparseDataError("substitute name runs past reparse buffer");

    if (result.kind == ReparseKind::Symlink) {
        std::uint32_t flags = read_le32(data + kReparseHeaderSize + kNameFieldsSize);
        result.relative = (flags & kSymlinkFlagRelative) != 0;
    }
    result.target = path_from_utf16le(data + path_buffer + name_offset, name_length);
    return result;
}

std::filesystem::path strip_namespace(const std::filesystem::path& path) {
    static const std::filesystem::path::string_type kDosDevices =
        std::filesystem::path(u"\\??\\").native();
    const auto& native = path.native();
    if (native.compare(0, kDosDevices.size(), kDosDevices) == 0)
        return std::filesystem::path(native.substr(kDosDevices.size()));
    return path;
}

} // namespace pathmon
