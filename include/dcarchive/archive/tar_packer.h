#ifndef DCARCHIVE_ARCHIVE_TAR_PACKER_H
#define DCARCHIVE_ARCHIVE_TAR_PACKER_H

#include <dcarchive/utils/filesystem.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct archive;

namespace dcarchive {

struct TarMember {
    std::string name;
    std::string data;
    std::int64_t mtime = 0;
};

/**
 * Builds one tar container in memory through libarchive, in restricted PAX
 * format: plain ustar headers, with a PAX extended header only for members
 * whose name does not fit ustar. Members keep insertion order.
 */
class TarPacker {
   public:
    explicit TarPacker(std::int64_t mtime_seconds);
    ~TarPacker();
    TarPacker(const TarPacker &) = delete;
    TarPacker &operator=(const TarPacker &) = delete;

    // @throws ArchiveError(PACKER_ERROR) if libarchive rejects the member
    void add(const std::string &name, const std::string &data);

    std::size_t member_count() const { return member_count_; }

    /**
     * Append the end-of-archive marker and return the container bytes,
     * padded to a whole tar record. The packer is empty afterwards.
     */
    std::string finish();

   private:
    struct WriterDeleter {
        void operator()(struct archive *writer) const;
    };

    void open();

    std::int64_t mtime_;
    std::size_t member_count_ = 0;
    std::string buffer_;
    std::unique_ptr<struct archive, WriterDeleter> writer_;
};

/**
 * Parse a tar container and return its regular-file members in order.
 * Understands ustar, PAX and GNU long names.
 * @throws ArchiveError(PACKER_ERROR) on a bad checksum or truncated data
 */
std::vector<TarMember> read_tar(const std::string &data);
std::vector<TarMember> read_tar_file(const fs::path &path);

// Member names only, without copying contents
std::vector<std::string> list_tar_names(const std::string &data);

}  // namespace dcarchive

#endif  // DCARCHIVE_ARCHIVE_TAR_PACKER_H
