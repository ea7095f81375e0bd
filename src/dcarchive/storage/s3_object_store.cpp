#include <aws/core/Aws.h>
#include <aws/core/auth/AWSAuthSigner.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/http/HttpResponse.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>
#include <aws/s3/model/ListObjectsV2Request.h>
#include <aws/s3/model/PutObjectRequest.h>
#include <dcarchive/common/error.h>
#include <dcarchive/common/logging.h>
#include <dcarchive/storage/s3_object_store.h>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace dcarchive {

namespace {
const char *ALLOCATION_TAG = "dcarchive";
}  // namespace

AwsSession::AwsSession() : options_(std::make_unique<Aws::SDKOptions>()) {
    Aws::InitAPI(*options_);
}

AwsSession::~AwsSession() { Aws::ShutdownAPI(*options_); }

S3ObjectStore::S3ObjectStore(S3StoreConfig config)
    : config_(std::move(config)) {
    if (config_.bucket.empty()) {
        throw ArchiveError(ArchiveError::INVALID_ARGUMENT,
                           "S3 bucket name is empty");
    }
    Aws::Client::ClientConfiguration client_config;
    if (!config_.region.empty()) {
        client_config.region = config_.region;
    }
    if (!config_.endpoint.empty()) {
        client_config.endpointOverride = config_.endpoint;
    }
    client_ = std::make_unique<Aws::S3::S3Client>(
        client_config,
        Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
        /*useVirtualAddressing=*/config_.endpoint.empty());
}

S3ObjectStore::~S3ObjectStore() = default;

void S3ObjectStore::put(const std::string &key, const std::string &data) {
    Aws::S3::Model::PutObjectRequest request;
    request.WithBucket(config_.bucket).WithKey(key);

    auto body = Aws::MakeShared<Aws::StringStream>(ALLOCATION_TAG);
    body->write(data.data(), static_cast<std::streamsize>(data.size()));
    request.SetBody(body);
    request.SetContentLength(static_cast<long long>(data.size()));

    auto outcome = client_->PutObject(request);
    if (!outcome.IsSuccess()) {
        throw ArchiveError(ArchiveError::STORAGE_ERROR,
                           "Failed to put s3://" + config_.bucket + "/" + key +
                               ": " + outcome.GetError().GetMessage());
    }
    DCARCHIVE_LOG_DEBUG("Stored s3://%s/%s (%zu bytes)",
                        config_.bucket.c_str(), key.c_str(), data.size());
}

void S3ObjectStore::put_file(const std::string &key, const fs::path &path) {
    auto body = Aws::MakeShared<Aws::FStream>(
        ALLOCATION_TAG, path.c_str(), std::ios_base::in | std::ios_base::binary);
    if (!body->good()) {
        throw ArchiveError(ArchiveError::STORAGE_ERROR,
                           "Cannot open " + path.string() + " for upload");
    }

    Aws::S3::Model::PutObjectRequest request;
    request.WithBucket(config_.bucket).WithKey(key);
    request.SetBody(body);

    auto outcome = client_->PutObject(request);
    if (!outcome.IsSuccess()) {
        throw ArchiveError(ArchiveError::STORAGE_ERROR,
                           "Failed to upload " + path.string() + " to s3://" +
                               config_.bucket + "/" + key + ": " +
                               outcome.GetError().GetMessage());
    }
    DCARCHIVE_LOG_DEBUG("Uploaded %s to s3://%s/%s", path.c_str(),
                        config_.bucket.c_str(), key.c_str());
}

std::optional<std::string> S3ObjectStore::get(const std::string &key) {
    Aws::S3::Model::GetObjectRequest request;
    request.WithBucket(config_.bucket).WithKey(key);

    auto outcome = client_->GetObject(request);
    if (!outcome.IsSuccess()) {
        if (outcome.GetError().GetResponseCode() ==
            Aws::Http::HttpResponseCode::NOT_FOUND) {
            return std::nullopt;
        }
        throw ArchiveError(ArchiveError::STORAGE_ERROR,
                           "Failed to get s3://" + config_.bucket + "/" + key +
                               ": " + outcome.GetError().GetMessage());
    }

    auto result = outcome.GetResultWithOwnership();
    std::ostringstream buffer;
    buffer << result.GetBody().rdbuf();
    return buffer.str();
}

bool S3ObjectStore::exists(const std::string &key) {
    Aws::S3::Model::HeadObjectRequest request;
    request.WithBucket(config_.bucket).WithKey(key);

    auto outcome = client_->HeadObject(request);
    if (outcome.IsSuccess()) return true;
    if (outcome.GetError().GetResponseCode() ==
        Aws::Http::HttpResponseCode::NOT_FOUND) {
        return false;
    }
    throw ArchiveError(ArchiveError::STORAGE_ERROR,
                       "Failed to stat s3://" + config_.bucket + "/" + key +
                           ": " + outcome.GetError().GetMessage());
}

std::vector<std::string> S3ObjectStore::list(const std::string &prefix) {
    std::vector<std::string> keys;
    Aws::S3::Model::ListObjectsV2Request request;
    request.WithBucket(config_.bucket).WithPrefix(prefix);

    while (true) {
        auto outcome = client_->ListObjectsV2(request);
        if (!outcome.IsSuccess()) {
            throw ArchiveError(ArchiveError::STORAGE_ERROR,
                               "Failed to list s3://" + config_.bucket + "/" +
                                   prefix + ": " +
                                   outcome.GetError().GetMessage());
        }
        const auto &result = outcome.GetResult();
        for (const auto &object : result.GetContents()) {
            keys.emplace_back(object.GetKey());
        }
        if (!result.GetIsTruncated()) break;
        request.SetContinuationToken(result.GetNextContinuationToken());
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

std::string S3ObjectStore::describe() const {
    return "s3://" + config_.bucket;
}

}  // namespace dcarchive
