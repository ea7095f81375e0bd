#include <dcarchive/common/error.h>
#include <dcarchive/common/logging.h>
#include <dcarchive/storage/object_store.h>
#include <dcarchive/utils/file.h>

#include <algorithm>
#include <system_error>

namespace dcarchive {

void ObjectStore::put_file(const std::string &key, const fs::path &path) {
    std::optional<std::string> data;
    try {
        data = utils::read_file(path);
    } catch (const std::runtime_error &e) {
        throw ArchiveError(ArchiveError::STORAGE_ERROR, e.what());
    }
    if (!data) {
        throw ArchiveError(ArchiveError::STORAGE_ERROR,
                           "Local file not found: " + path.string());
    }
    put(key, *data);
}

LocalObjectStore::LocalObjectStore(fs::path root) : root_(std::move(root)) {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        throw ArchiveError(ArchiveError::STORAGE_ERROR,
                           "Cannot create store root " + root_.string() +
                               ": " + ec.message());
    }
}

fs::path LocalObjectStore::resolve(const std::string &key) const {
    if (key.empty() || key.front() == '/') {
        throw ArchiveError(ArchiveError::INVALID_ARGUMENT,
                           "Invalid object key: '" + key + "'");
    }
    fs::path relative(key);
    for (const auto &component : relative) {
        if (component == "..") {
            throw ArchiveError(ArchiveError::INVALID_ARGUMENT,
                               "Object key escapes the store: " + key);
        }
    }
    return root_ / relative;
}

void LocalObjectStore::put(const std::string &key, const std::string &data) {
    fs::path target = resolve(key);
    try {
        utils::write_file_atomic(target, data);
    } catch (const std::runtime_error &e) {
        throw ArchiveError(ArchiveError::STORAGE_ERROR,
                           "Failed to put " + key + ": " + e.what());
    }
    DCARCHIVE_LOG_DEBUG("Stored %s (%zu bytes)", key.c_str(), data.size());
}

void LocalObjectStore::put_file(const std::string &key, const fs::path &path) {
    fs::path target = resolve(key);
    fs::path tmp = utils::unique_temp_path(target);

    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (!ec) fs::copy_file(path, tmp, fs::copy_options::overwrite_existing, ec);
    if (!ec) fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw ArchiveError(ArchiveError::STORAGE_ERROR,
                           "Failed to upload " + path.string() + " to " + key +
                               ": " + ec.message());
    }
    DCARCHIVE_LOG_DEBUG("Uploaded %s to %s", path.c_str(), key.c_str());
}

std::optional<std::string> LocalObjectStore::get(const std::string &key) {
    try {
        return utils::read_file(resolve(key));
    } catch (const std::runtime_error &e) {
        throw ArchiveError(ArchiveError::STORAGE_ERROR,
                           "Failed to get " + key + ": " + e.what());
    }
}

bool LocalObjectStore::exists(const std::string &key) {
    std::error_code ec;
    bool found = fs::is_regular_file(resolve(key), ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        throw ArchiveError(ArchiveError::STORAGE_ERROR,
                           "Failed to stat " + key + ": " + ec.message());
    }
    return found;
}

std::vector<std::string> LocalObjectStore::list(const std::string &prefix) {
    std::vector<std::string> keys;

    // Walk only the deepest directory the prefix names
    fs::path start = root_;
    auto slash = prefix.rfind('/');
    if (slash != std::string::npos) {
        start = root_ / prefix.substr(0, slash);
    }

    std::error_code ec;
    if (!fs::is_directory(start, ec)) {
        return keys;
    }

    fs::recursive_directory_iterator it(start, ec), end;
    if (ec) {
        throw ArchiveError(ArchiveError::STORAGE_ERROR,
                           "Failed to list " + start.string() + ": " +
                               ec.message());
    }
    for (; it != end; it.increment(ec)) {
        if (ec) {
            throw ArchiveError(ArchiveError::STORAGE_ERROR,
                               "Failed to list " + start.string() + ": " +
                                   ec.message());
        }
        if (!it->is_regular_file()) continue;

        std::string key = it->path().lexically_relative(root_).generic_string();
        // In-flight writes of put()/put_file()
        if (key.find(".tmp.") != std::string::npos) continue;
        if (key.compare(0, prefix.size(), prefix) == 0) {
            keys.push_back(std::move(key));
        }
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

std::string LocalObjectStore::describe() const {
    return "file://" + root_.string();
}

}  // namespace dcarchive
