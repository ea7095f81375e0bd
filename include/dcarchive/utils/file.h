#ifndef DCARCHIVE_UTILS_FILE_H
#define DCARCHIVE_UTILS_FILE_H

#include <dcarchive/utils/filesystem.h>

#include <cstdint>
#include <optional>
#include <string>

namespace dcarchive::utils {

/**
 * Read a whole file in binary mode
 * @return file contents, or std::nullopt if the file does not exist
 * @throws std::runtime_error if the file exists but cannot be read
 */
std::optional<std::string> read_file(const fs::path &path);

/**
 * Write bytes to a temporary sibling and rename it over path, so readers
 * never observe a partially written file. Parent directories are created.
 * @throws std::runtime_error on any I/O failure
 */
void write_file_atomic(const fs::path &path, const std::string &data);

// Sibling of path unique to this process and call, for write-then-rename
fs::path unique_temp_path(const fs::path &path);

/**
 * Size and modification time of a file, used to detect that another process
 * rewrote it. Empty when the file does not exist.
 */
struct FileStamp {
    std::uintmax_t size;
    fs::file_time_type mtime;

    bool operator==(const FileStamp &other) const {
        return size == other.size && mtime == other.mtime;
    }
    bool operator!=(const FileStamp &other) const { return !(*this == other); }
};
std::optional<FileStamp> get_file_stamp(const fs::path &path);

/**
 * "1.50 KB" style sizes, as written into Index documents
 */
std::string human_readable_size(std::uint64_t size_bytes);

}  // namespace dcarchive::utils

#endif  // DCARCHIVE_UTILS_FILE_H
