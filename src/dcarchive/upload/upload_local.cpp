#include <dcarchive/archive/tar_packer.h>
#include <dcarchive/common/error.h>
#include <dcarchive/common/logging.h>
#include <dcarchive/upload/upload_local.h>
#include <dcarchive/utils/file.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <system_error>

namespace dcarchive {

namespace {

struct PartitionDir {
    fs::path path;
    std::string year;
    std::string state_code;
    std::string district_code;
    std::string complex_code;
    std::vector<std::string> containers;
};

bool is_container(const fs::path &path) {
    std::string name = path.filename().string();
    return path.extension() == constants::archive::PART_SUFFIX &&
           name.find(".tmp.") == std::string::npos;
}

std::optional<int> parse_year(const std::string &text) {
    if (text.empty() || text.size() > 4 ||
        !std::all_of(text.begin(), text.end(), [](unsigned char c) {
            return std::isdigit(c) != 0;
        })) {
        return std::nullopt;
    }
    int year = std::stoi(text);
    if (std::to_string(year) != text) return std::nullopt;
    return year;
}

// {local_dir}/{Y}/{S}/{D}/{C}/*.tar grouped by directory, sorted
std::vector<PartitionDir> scan_partitions(const fs::path &local_dir) {
    std::map<fs::path, PartitionDir> dirs;
    std::error_code ec;
    fs::recursive_directory_iterator it(local_dir, ec), end;
    for (; !ec && it != end; it.increment(ec)) {
        if (it.depth() > 4) {
            it.disable_recursion_pending();
            continue;
        }
        if (it.depth() != 4 || !it->is_regular_file(ec) ||
            !is_container(it->path())) {
            continue;
        }
        fs::path dir = it->path().parent_path();
        auto &partition = dirs[dir];
        if (partition.containers.empty()) {
            auto rel = fs::relative(dir, local_dir, ec);
            std::vector<std::string> parts;
            for (const auto &p : rel) parts.push_back(p.string());
            if (parts.size() != 4) continue;
            partition.path = dir;
            partition.year = parts[0];
            partition.state_code = parts[1];
            partition.district_code = parts[2];
            partition.complex_code = parts[3];
        }
        partition.containers.push_back(it->path().filename().string());
    }
    if (ec) {
        DCARCHIVE_LOG_WARN("Scan of %s stopped early: %s",
                           local_dir.string().c_str(), ec.message().c_str());
    }

    std::vector<PartitionDir> result;
    for (auto &entry : dirs) {
        if (entry.second.path.empty()) continue;
        std::sort(entry.second.containers.begin(),
                  entry.second.containers.end());
        result.push_back(std::move(entry.second));
    }
    return result;
}

bool starts_with(const std::string &s, const char *prefix) {
    return s.rfind(prefix, 0) == 0;
}

}  // namespace

std::optional<ArchiveType> classify_container(
    const std::string &name, const std::vector<std::string> &siblings) {
    if (starts_with(name, constants::archive::DOCUMENT_ARCHIVE)) {
        return ArchiveType::DOCUMENT;
    }
    if (starts_with(name, constants::archive::METADATA_ARCHIVE)) {
        return ArchiveType::METADATA;
    }
    if (starts_with(name, "part-")) {
        bool documents = std::any_of(
            siblings.begin(), siblings.end(), [](const std::string &s) {
                return s.find(constants::archive::DOCUMENT_ARCHIVE) !=
                       std::string::npos;
            });
        return documents ? ArchiveType::DOCUMENT : ArchiveType::METADATA;
    }
    return std::nullopt;
}

PartitionIndex build_container_index(const PartitionKey &key,
                                     const fs::path &container,
                                     const Timestamp &now) {
    auto data = utils::read_file(container);
    if (!data) {
        throw ArchiveError(ArchiveError::STORAGE_ERROR,
                           "Container disappeared: " + container.string());
    }

    PartDescriptor part;
    part.name = container.filename().string();
    part.size = data->size();
    part.created_at = now;
    for (const auto &name : list_tar_names(*data)) {
        part.files.push_back(fs::path(name).filename().string());
    }

    PartitionIndex index(key);
    index.append_part(std::move(part));
    return index;
}

UploadLocalReport upload_local_files(ObjectStore &store,
                                     const UploadLocalOptions &options) {
    UploadLocalReport report;
    std::error_code ec;
    if (!fs::is_directory(options.local_dir, ec)) {
        DCARCHIVE_LOG_ERROR("Local directory does not exist: %s",
                            options.local_dir.string().c_str());
        return report;
    }

    DCARCHIVE_LOG_INFO("Uploading local files from %s to %s%s",
                       options.local_dir.string().c_str(),
                       store.describe().c_str(), options.prefix.c_str());

    auto partitions = scan_partitions(options.local_dir);
    if (partitions.empty()) {
        DCARCHIVE_LOG_WARN("No TAR files found in %s",
                           options.local_dir.string().c_str());
        return report;
    }

    for (const auto &dir : partitions) {
        auto year = parse_year(dir.year);
        if (!year) {
            DCARCHIVE_LOG_WARN("Skipping unexpected path structure: %s",
                               dir.path.string().c_str());
            continue;
        }
        CourtComplex court;
        court.state_code = dir.state_code;
        court.district_code = dir.district_code;
        court.complex_code = dir.complex_code;
        if (!options.filter.matches(court)) continue;

        std::map<ArchiveType, std::vector<std::string>> groups;
        for (const auto &name : dir.containers) {
            auto type = classify_container(name, dir.containers);
            if (!type) {
                DCARCHIVE_LOG_WARN("Unknown archive type for %s",
                                   (dir.path / name).string().c_str());
                continue;
            }
            groups[*type].push_back(name);
        }

        for (const auto &group : groups) {
            PartitionKey key{*year, dir.state_code, dir.district_code,
                             dir.complex_code, group.first};
            std::string legacy_name =
                std::string(archive_name(key.archive_type)) +
                constants::archive::PART_SUFFIX;
            bool all_present = true;
            bool any_uploaded = false;
            bool legacy_indexed = false;

            for (const auto &name : group.second) {
                ++report.found;
                fs::path path = dir.path / name;
                std::string remote = key.remote_part_key(options.prefix, name);
                try {
                    if (store.exists(remote)) {
                        DCARCHIVE_LOG_DEBUG("Already exists in store: %s",
                                            remote.c_str());
                        ++report.skipped;
                        continue;
                    }
                    auto stamp = utils::get_file_stamp(path);
                    DCARCHIVE_LOG_INFO(
                        "Uploading %s (%s) for %s", name.c_str(),
                        utils::human_readable_size(stamp ? stamp->size : 0)
                            .c_str(),
                        key.location().c_str());
                    if (options.dry_run) {
                        DCARCHIVE_LOG_INFO("  [DRY RUN] Would upload to: %s",
                                           remote.c_str());
                        all_present = false;
                        continue;
                    }

                    store.put_file(remote, path);
                    ++report.uploaded;
                    report.uploaded_keys.push_back(remote);
                    any_uploaded = true;

                    if (name == legacy_name) {
                        auto index = build_container_index(
                            key, path,
                            Timestamp::now(options.utc_offset_minutes));
                        std::string text = index.to_json();
                        store.put(key.remote_index_key(options.prefix), text);
                        utils::write_file_atomic(
                            key.local_index_path(options.local_dir), text);
                        ++report.indexes_uploaded;
                        legacy_indexed = true;
                        DCARCHIVE_LOG_INFO("  Uploaded index (%llu files)",
                                           static_cast<unsigned long long>(
                                               index.file_count()));
                    }
                } catch (const std::exception &e) {
                    ++report.failed;
                    all_present = false;
                    DCARCHIVE_LOG_ERROR("Failed to upload %s: %s",
                                        path.string().c_str(), e.what());
                }
            }

            if (options.dry_run || !all_present || legacy_indexed) continue;

            fs::path local_index = key.local_index_path(options.local_dir);
            std::string remote_index = key.remote_index_key(options.prefix);
            try {
                auto text = utils::read_file(local_index);
                if (!text) continue;
                if (!any_uploaded && store.exists(remote_index)) continue;

                // Refuse to publish an Index the archive could not read
                PartitionIndex::from_json(key, *text);
                store.put(remote_index, *text);
                ++report.indexes_uploaded;
                DCARCHIVE_LOG_INFO("  Uploaded index %s",
                                   remote_index.c_str());
            } catch (const std::exception &e) {
                ++report.failed;
                DCARCHIVE_LOG_ERROR("Failed to upload index %s: %s",
                                    local_index.string().c_str(), e.what());
            }
        }
    }

    DCARCHIVE_LOG_INFO(
        "Upload complete: %zu uploaded, %zu skipped (already in store), %zu "
        "failed",
        report.uploaded, report.skipped, report.failed);
    return report;
}

}  // namespace dcarchive
