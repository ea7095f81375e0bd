#ifndef DCARCHIVE_ARCHIVE_PARTITION_CATALOG_H
#define DCARCHIVE_ARCHIVE_PARTITION_CATALOG_H

#include <dcarchive/common/partition.h>
#include <dcarchive/storage/object_store.h>
#include <dcarchive/utils/filesystem.h>

#include <optional>
#include <string>
#include <vector>

namespace dcarchive {

struct PartitionListing {
    PartitionKey key;
    bool has_index = false;
    // Container names found beside the Index, sorted
    std::vector<std::string> part_names;
};

/**
 * Read-only view of the partitions stored somewhere, either under the
 * remote object layout or the local directory layout.
 */
class PartitionCatalog {
   public:
    virtual ~PartitionCatalog() = default;

    // Partitions of one archive type, optionally restricted to a state
    virtual std::vector<PartitionListing> list(
        ArchiveType type, const std::optional<std::string> &state_code) = 0;
    virtual std::optional<std::string> read_index(const PartitionKey &key) = 0;
    virtual std::optional<std::string> read_part(
        const PartitionKey &key, const std::string &part_name) = 0;
};

// "{prefix}{root}/tar/year=Y/state=S/district=D/complex=C/..."
class StorePartitionCatalog : public PartitionCatalog {
   public:
    StorePartitionCatalog(ObjectStore &store, std::string prefix);

    std::vector<PartitionListing> list(
        ArchiveType type,
        const std::optional<std::string> &state_code) override;
    std::optional<std::string> read_index(const PartitionKey &key) override;
    std::optional<std::string> read_part(const PartitionKey &key,
                                         const std::string &part_name) override;

   private:
    ObjectStore &store_;
    std::string prefix_;
};

// "{local_dir}/{Y}/{S}/{D}/{C}/..."
class LocalPartitionCatalog : public PartitionCatalog {
   public:
    explicit LocalPartitionCatalog(fs::path local_dir);

    std::vector<PartitionListing> list(
        ArchiveType type,
        const std::optional<std::string> &state_code) override;
    std::optional<std::string> read_index(const PartitionKey &key) override;
    std::optional<std::string> read_part(const PartitionKey &key,
                                         const std::string &part_name) override;

   private:
    fs::path local_dir_;
};

}  // namespace dcarchive

#endif  // DCARCHIVE_ARCHIVE_PARTITION_CATALOG_H
