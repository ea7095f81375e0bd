#ifndef DCARCHIVE_ARCHIVE_PARTITION_INDEX_H
#define DCARCHIVE_ARCHIVE_PARTITION_INDEX_H

#include <dcarchive/common/date.h>
#include <dcarchive/common/partition.h>

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace dcarchive {

struct PartDescriptor {
    std::string name;
    std::vector<std::string> files;
    // Byte size of the container
    std::uint64_t size = 0;
    Timestamp created_at;

    std::size_t file_count() const { return files.size(); }
};

/**
 * Ledger of the Parts of one partition, persisted as
 * "{archive}.index.json". Append-only at Part granularity; file_count and
 * total_size are exact sums over the Parts and updated_at is always the
 * creation time of the last Part.
 */
class PartitionIndex {
   public:
    explicit PartitionIndex(PartitionKey key);

    /**
     * Parse an Index document. Sums are recomputed from the Part list; a
     * document whose stored sums disagree is accepted with a warning.
     * @throws ArchiveError(INDEX_ERROR) if the document is not a valid Index
     */
    static PartitionIndex from_json(const PartitionKey &key,
                                    const std::string &text);

    // @throws ArchiveError(INDEX_ERROR) on a duplicate Part name
    void append_part(PartDescriptor part);

    bool contains(const std::string &filename) const;
    bool has_part(const std::string &part_name) const;
    bool empty() const { return parts_.empty(); }

    const PartitionKey &key() const { return key_; }
    const std::vector<PartDescriptor> &parts() const { return parts_; }
    std::uint64_t file_count() const { return file_count_; }
    std::uint64_t total_size() const { return total_size_; }
    std::optional<Timestamp> created_at() const;
    std::optional<Timestamp> updated_at() const;

    /**
     * Deterministic two-space indented JSON.
     * @throws ArchiveError(INDEX_ERROR) if a name is not valid UTF-8
     */
    std::string to_json() const;

   private:
    PartitionKey key_;
    std::vector<PartDescriptor> parts_;
    std::unordered_set<std::string> filenames_;
    std::uint64_t file_count_ = 0;
    std::uint64_t total_size_ = 0;
};

}  // namespace dcarchive

#endif  // DCARCHIVE_ARCHIVE_PARTITION_INDEX_H
