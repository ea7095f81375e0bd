#ifndef DCARCHIVE_STORAGE_OBJECT_STORE_H
#define DCARCHIVE_STORAGE_OBJECT_STORE_H

#include <dcarchive/utils/filesystem.h>

#include <optional>
#include <string>
#include <vector>

namespace dcarchive {

/**
 * Flat key/value object storage addressed by '/'-separated keys, the remote
 * side of the archive. Implementations throw ArchiveError(STORAGE_ERROR) on
 * any failure other than a missing key.
 */
class ObjectStore {
   public:
    virtual ~ObjectStore() = default;

    virtual void put(const std::string &key, const std::string &data) = 0;
    virtual void put_file(const std::string &key, const fs::path &path);
    virtual std::optional<std::string> get(const std::string &key) = 0;
    virtual bool exists(const std::string &key) = 0;
    // All keys starting with prefix, sorted
    virtual std::vector<std::string> list(const std::string &prefix) = 0;
    virtual std::string describe() const = 0;
};

/**
 * Object store backed by a directory; keys map to relative paths. Writes
 * go through a temporary file and a rename.
 */
class LocalObjectStore : public ObjectStore {
   public:
    explicit LocalObjectStore(fs::path root);

    void put(const std::string &key, const std::string &data) override;
    void put_file(const std::string &key, const fs::path &path) override;
    std::optional<std::string> get(const std::string &key) override;
    bool exists(const std::string &key) override;
    std::vector<std::string> list(const std::string &prefix) override;
    std::string describe() const override;

    const fs::path &root() const { return root_; }

   private:
    fs::path resolve(const std::string &key) const;

    fs::path root_;
};

}  // namespace dcarchive

#endif  // DCARCHIVE_STORAGE_OBJECT_STORE_H
