#ifndef DCARCHIVE_STORAGE_S3_OBJECT_STORE_H
#define DCARCHIVE_STORAGE_S3_OBJECT_STORE_H

#include <dcarchive/storage/object_store.h>

#include <memory>
#include <string>

namespace Aws {
struct SDKOptions;
namespace S3 {
class S3Client;
}  // namespace S3
}  // namespace Aws

namespace dcarchive {

/**
 * Initializes the AWS SDK for its lifetime. Exactly one must outlive every
 * S3ObjectStore.
 */
class AwsSession {
   public:
    AwsSession();
    ~AwsSession();
    AwsSession(const AwsSession &) = delete;
    AwsSession &operator=(const AwsSession &) = delete;

   private:
    std::unique_ptr<Aws::SDKOptions> options_;
};

struct S3StoreConfig {
    std::string bucket;
    std::string region;
    // Custom endpoint for S3-compatible services; empty for AWS
    std::string endpoint;
};

class S3ObjectStore : public ObjectStore {
   public:
    explicit S3ObjectStore(S3StoreConfig config);
    ~S3ObjectStore() override;

    void put(const std::string &key, const std::string &data) override;
    void put_file(const std::string &key, const fs::path &path) override;
    std::optional<std::string> get(const std::string &key) override;
    bool exists(const std::string &key) override;
    std::vector<std::string> list(const std::string &prefix) override;
    std::string describe() const override;

   private:
    S3StoreConfig config_;
    std::unique_ptr<Aws::S3::S3Client> client_;
};

}  // namespace dcarchive

#endif  // DCARCHIVE_STORAGE_S3_OBJECT_STORE_H
