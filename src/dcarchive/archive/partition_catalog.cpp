#include <dcarchive/archive/partition_catalog.h>
#include <dcarchive/common/constants.h>
#include <dcarchive/common/error.h>
#include <dcarchive/common/logging.h>
#include <dcarchive/utils/file.h>

#include <algorithm>
#include <cstdlib>
#include <map>
#include <system_error>

namespace dcarchive {

using namespace constants::archive;

namespace {

bool ends_with(const std::string &s, const std::string &suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool starts_with(const std::string &s, const std::string &prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

std::vector<PartitionListing> collect(
    std::map<PartitionKey, PartitionListing> &grouped) {
    std::vector<PartitionListing> out;
    out.reserve(grouped.size());
    for (auto &entry : grouped) {
        std::sort(entry.second.part_names.begin(),
                  entry.second.part_names.end());
        out.push_back(std::move(entry.second));
    }
    return out;
}

void add_file(std::map<PartitionKey, PartitionListing> &grouped,
              const PartitionKey &key, const std::string &filename) {
    std::string index_name = std::string(archive_name(key.archive_type)) +
                             INDEX_SUFFIX;
    if (filename == index_name) {
        auto &listing = grouped[key];
        listing.key = key;
        listing.has_index = true;
    } else if (ends_with(filename, PART_SUFFIX) &&
               starts_with(filename, archive_name(key.archive_type))) {
        auto &listing = grouped[key];
        listing.key = key;
        listing.part_names.push_back(filename);
    }
}

}  // namespace

StorePartitionCatalog::StorePartitionCatalog(ObjectStore &store,
                                             std::string prefix)
    : store_(store), prefix_(std::move(prefix)) {}

std::vector<PartitionListing> StorePartitionCatalog::list(
    ArchiveType type, const std::optional<std::string> &state_code) {
    std::string root =
        prefix_ + storage_root(type) + "/" + CONTAINER_DIR + "/";
    std::map<PartitionKey, PartitionListing> grouped;

    for (const auto &object_key : store_.list(root)) {
        auto object = parse_remote_key(object_key, prefix_);
        if (!object || object->partition.archive_type != type) continue;
        if (state_code && object->partition.state_code != *state_code) {
            continue;
        }
        add_file(grouped, object->partition, object->filename);
    }
    return collect(grouped);
}

std::optional<std::string> StorePartitionCatalog::read_index(
    const PartitionKey &key) {
    return store_.get(key.remote_index_key(prefix_));
}

std::optional<std::string> StorePartitionCatalog::read_part(
    const PartitionKey &key, const std::string &part_name) {
    return store_.get(key.remote_part_key(prefix_, part_name));
}

LocalPartitionCatalog::LocalPartitionCatalog(fs::path local_dir)
    : local_dir_(std::move(local_dir)) {}

std::vector<PartitionListing> LocalPartitionCatalog::list(
    ArchiveType type, const std::optional<std::string> &state_code) {
    std::map<PartitionKey, PartitionListing> grouped;

    std::error_code ec;
    if (!fs::is_directory(local_dir_, ec)) {
        return {};
    }

    fs::recursive_directory_iterator it(local_dir_, ec), end;
    if (ec) {
        throw ArchiveError(ArchiveError::STORAGE_ERROR,
                           "Cannot scan " + local_dir_.string() + ": " +
                               ec.message());
    }
    for (; it != end; it.increment(ec)) {
        if (ec) {
            throw ArchiveError(ArchiveError::STORAGE_ERROR,
                               "Cannot scan " + local_dir_.string() + ": " +
                                   ec.message());
        }
        // {Y}/{S}/{D}/{C}/{file}
        if (it.depth() != 4 || !it->is_regular_file()) continue;

        fs::path relative = it->path().lexically_relative(local_dir_);
        std::vector<std::string> parts;
        for (const auto &component : relative) {
            parts.push_back(component.string());
        }
        if (parts.size() != 5) continue;

        char *year_end = nullptr;
        long year = std::strtol(parts[0].c_str(), &year_end, 10);
        if (year_end == parts[0].c_str() || *year_end != '\0') continue;
        if (state_code && parts[1] != *state_code) continue;

        PartitionKey key;
        key.year = static_cast<int>(year);
        key.state_code = parts[1];
        key.district_code = parts[2];
        key.complex_code = parts[3];
        key.archive_type = type;
        add_file(grouped, key, parts[4]);
    }
    return collect(grouped);
}

std::optional<std::string> LocalPartitionCatalog::read_index(
    const PartitionKey &key) {
    try {
        return utils::read_file(key.local_index_path(local_dir_));
    } catch (const std::runtime_error &e) {
        throw ArchiveError(ArchiveError::STORAGE_ERROR, e.what());
    }
}

std::optional<std::string> LocalPartitionCatalog::read_part(
    const PartitionKey &key, const std::string &part_name) {
    try {
        return utils::read_file(key.local_dir(local_dir_) / part_name);
    } catch (const std::runtime_error &e) {
        throw ArchiveError(ArchiveError::STORAGE_ERROR, e.what());
    }
}

}  // namespace dcarchive
