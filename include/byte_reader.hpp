#ifndef BYTE_READER_HPP
#define BYTE_READER_HPP
#include <cstdint>

namespace pathmon {

// Little-endian reads from unaligned storage.
inline std::uint16_t read_le16(const std::uint8_t* p) {
    return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

inline std::uint32_t read_le32(const std::uint8_t* p) {
    return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) |
           (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
}

} // namespace pathmon

#endif // BYTE_READER_HPP
