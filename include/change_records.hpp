#ifndef CHANGE_RECORDS_HPP
#define CHANGE_RECORDS_HPP
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <vector>

namespace pathmon {

/** Raised when a change-record batch is truncated or self-inconsistent. */
class ChangeRecordError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief One create/delete/rename event delivered for a watched directory.
 *
 * For `FILE_NOTIFY_INFORMATION` batches `action` is the `FILE_ACTION_*`
 * value and `watch` is unused (-1). For inotify batches `action` holds the
 * event mask and `watch` the watch descriptor the name is relative to.
 */
struct ChangeRecord {
    std::uint32_t action = 0;
    std::int32_t watch = -1;
    std::filesystem::path name;
};

/**
 * @brief Decode a chain of `FILE_NOTIFY_INFORMATION` records.
 *
 * Each record starts with the byte offset of the next one; zero ends the
 * chain. Offsets must be 4-byte aligned and stay inside @p size.
 *
 * @throws ChangeRecordError on a malformed chain.
 */
std::vector<ChangeRecord> decode_notify_information(const std::uint8_t* data, std::size_t size);

/**
 * @brief Decode a batch read from an inotify descriptor.
 *
 * Records are packed back to back; each is a fixed 16-byte header followed
 * by `len` bytes of NUL-padded name.
 *
 * @throws ChangeRecordError on a truncated record.
 */
std::vector<ChangeRecord> decode_inotify_events(const std::uint8_t* data, std::size_t size);

} // namespace pathmon

#endif // CHANGE_RECORDS_HPP
