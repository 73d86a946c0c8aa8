#include "change_records.hpp"

#include <cstring>
#include <string>

#include "byte_reader.hpp"
#include "reparse_data.hpp"

namespace pathmon {

namespace {
constexpr std::size_t kNotifyHeaderSize = 12;
constexpr std::size_t kInotifyHeaderSize = 16;
} // namespace

std::vector<ChangeRecord> decode_notify_information(const std::uint8_t* data, std::size_t size) {
    std::vector<ChangeRecord> records;
    std::size_t offset = 0;
    while (true) {
        if (offset + kNotifyHeaderSize > size)
            throw ChangeRecordError("notify record header runs past buffer");
        const std::uint8_t* rec = data + offset;
        std::uint32_t next = read_le32(rec);
        ChangeRecord record;
        record.action = read_le32(rec + 4);
        std::size_t name_length = read_le32(rec + 8);
        if (name_length > size - offset - kNotifyHeaderSize)
            throw ChangeRecordError("notify record name runs past buffer");
        record.name = path_from_utf16le(rec + kNotifyHeaderSize, name_length);
        records.push_back(std::move(record));

        if (next == 0)
            break;
        if (next % 4 != 0 || next < kNotifyHeaderSize || next > size - offset)
            throw ChangeRecordError("invalid next entry offset " + std::to_string(next));
        offset += next;
    }
    return records;
}

std::vector<ChangeRecord> decode_inotify_events(const std::uint8_t* data, std::size_t size) {
    std::vector<ChangeRecord> records;
    std::size_t offset = 0;
    while (offset < size) {
        if (size - offset < kInotifyHeaderSize)
            throw ChangeRecordError("inotify event header runs past buffer");
        std::int32_t wd = 0;
        std::uint32_t mask = 0;
        std::uint32_t len = 0;
        std::memcpy(&wd, data + offset, sizeof(wd));
        std::memcpy(&mask, data + offset + 4, sizeof(mask));
        std::memcpy(&len, data + offset + 12, sizeof(len));
        if (len > size - offset - kInotifyHeaderSize)
            throw ChangeRecordError("inotify event name runs past buffer");

        const char* name = reinterpret_cast<const char*>(data + offset + kInotifyHeaderSize);
        ChangeRecord record;
        record.action = mask;
        record.watch = wd;
        record.name = std::filesystem::path(std::string(name, strnlen(name, len)));
        records.push_back(std::move(record));
        offset += kInotifyHeaderSize + len;
    }
    return records;
}

} // namespace pathmon
