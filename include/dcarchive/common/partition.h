#ifndef DCARCHIVE_COMMON_PARTITION_H
#define DCARCHIVE_COMMON_PARTITION_H

#include <dcarchive/utils/filesystem.h>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace dcarchive {

enum class ArchiveType { METADATA, DOCUMENT };

// "metadata" or "orders", the name of the archive inside a partition
const char *archive_name(ArchiveType type);
// "metadata" or "data", the top-level directory of the object layout
const char *storage_root(ArchiveType type);
// Accepts the archive name ("metadata", "orders") or "document"
std::optional<ArchiveType> parse_archive_type(std::string_view name);

/**
 * The unit of isolation of the archive. Codes are kept as strings because
 * the portal treats them as opaque identifiers.
 */
struct PartitionKey {
    int year = 0;
    std::string state_code;
    std::string district_code;
    std::string complex_code;
    ArchiveType archive_type = ArchiveType::METADATA;

    // "year=2024/state=29/district=9/complex=1290105"
    std::string location() const;

    // "{prefix}{root}/tar/{location}/"
    std::string remote_dir(const std::string &prefix) const;
    std::string remote_part_key(const std::string &prefix,
                                const std::string &part_name) const;
    std::string remote_index_key(const std::string &prefix) const;

    // "{local_root}/{Y}/{S}/{D}/{C}"
    fs::path local_dir(const fs::path &local_root) const;
    fs::path local_index_path(const fs::path &local_root) const;

    std::string to_string() const;

    bool operator==(const PartitionKey &other) const;
    bool operator!=(const PartitionKey &other) const {
        return !(*this == other);
    }
    bool operator<(const PartitionKey &other) const;
};

struct PartitionKeyHash {
    std::size_t operator()(const PartitionKey &key) const;
};

/**
 * A remote object key decomposed against the storage layout.
 */
struct RemoteObject {
    PartitionKey partition;
    std::string filename;
};

/**
 * Parse "{prefix}{root}/tar/year=Y/state=S/district=D/complex=C/{file}".
 * The archive type comes from the root directory.
 * @return std::nullopt for keys outside the layout
 */
std::optional<RemoteObject> parse_remote_key(const std::string &key,
                                             const std::string &prefix);

}  // namespace dcarchive

#endif  // DCARCHIVE_COMMON_PARTITION_H
