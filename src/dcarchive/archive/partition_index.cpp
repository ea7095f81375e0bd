#include <dcarchive/archive/partition_index.h>
#include <dcarchive/common/error.h>
#include <dcarchive/common/logging.h>
#include <dcarchive/utils/file.h>
#include <dcarchive/utils/json.h>

#include <nlohmann/json.hpp>

namespace dcarchive {

PartitionIndex::PartitionIndex(PartitionKey key) : key_(std::move(key)) {}

void PartitionIndex::append_part(PartDescriptor part) {
    if (has_part(part.name)) {
        throw ArchiveError(ArchiveError::INDEX_ERROR,
                           "Part " + part.name + " already indexed in " +
                               key_.to_string());
    }
    for (const auto &file : part.files) {
        if (!filenames_.insert(file).second) {
            DCARCHIVE_LOG_WARN("File %s appears in more than one Part of %s",
                               file.c_str(), key_.to_string().c_str());
        }
    }
    file_count_ += part.files.size();
    total_size_ += part.size;
    parts_.push_back(std::move(part));
}

bool PartitionIndex::contains(const std::string &filename) const {
    return filenames_.count(filename) > 0;
}

bool PartitionIndex::has_part(const std::string &part_name) const {
    for (const auto &part : parts_) {
        if (part.name == part_name) return true;
    }
    return false;
}

std::optional<Timestamp> PartitionIndex::created_at() const {
    if (parts_.empty()) return std::nullopt;
    return parts_.front().created_at;
}

std::optional<Timestamp> PartitionIndex::updated_at() const {
    if (parts_.empty()) return std::nullopt;
    return parts_.back().created_at;
}

PartitionIndex PartitionIndex::from_json(const PartitionKey &key,
                                         const std::string &text) {
    json::JsonParser parser;
    auto doc = json::parse_json(parser, text.data(), text.size());
    if (!doc || !doc->is_object()) {
        throw ArchiveError(ArchiveError::INDEX_ERROR,
                           "Index of " + key.to_string() + " is not JSON");
    }

    auto stored_type = json::find_string_field(*doc, "archive_type");
    if (stored_type && *stored_type != archive_name(key.archive_type)) {
        throw ArchiveError(ArchiveError::INDEX_ERROR,
                           "Index of " + key.to_string() +
                               " has archive_type " + *stored_type);
    }

    PartitionIndex index(key);
    auto parts = doc->get_object().at_key("parts");
    if (!parts.error()) {
        auto parts_array = parts.value().get_array();
        if (parts_array.error()) {
            throw ArchiveError(ArchiveError::INDEX_ERROR,
                               "Index of " + key.to_string() +
                                   " has a malformed parts list");
        }
        for (auto element : parts_array.value()) {
            PartDescriptor part;
            part.name = json::get_string_field(element, "name");
            if (part.name.empty()) {
                throw ArchiveError(ArchiveError::INDEX_ERROR,
                                   "Index of " + key.to_string() +
                                       " has a Part without a name");
            }
            part.files = json::get_string_array_field(element, "files");
            part.size = json::get_uint64_field(element, "size");

            auto created = Timestamp::parse(
                json::get_string_field(element, "created_at"));
            if (!created) {
                throw ArchiveError(ArchiveError::INDEX_ERROR,
                                   "Part " + part.name + " of " +
                                       key.to_string() +
                                       " has no valid created_at");
            }
            part.created_at = *created;

            std::uint64_t stored_count =
                json::get_uint64_field(element, "file_count");
            if (stored_count != part.files.size()) {
                DCARCHIVE_LOG_WARN(
                    "Part %s of %s lists %zu files but records file_count "
                    "%llu",
                    part.name.c_str(), key.to_string().c_str(),
                    part.files.size(),
                    static_cast<unsigned long long>(stored_count));
            }
            index.append_part(std::move(part));
        }
    }

    std::uint64_t stored_total = json::get_uint64_field(*doc, "file_count");
    if (stored_total != index.file_count()) {
        DCARCHIVE_LOG_WARN(
            "Index of %s records file_count %llu, recomputed %llu",
            key.to_string().c_str(),
            static_cast<unsigned long long>(stored_total),
            static_cast<unsigned long long>(index.file_count()));
    }
    return index;
}

std::string PartitionIndex::to_json() const {
    auto timestamp_or_null = [](const std::optional<Timestamp> &ts) {
        return ts ? nlohmann::ordered_json(ts->to_iso_string())
                  : nlohmann::ordered_json(nullptr);
    };

    nlohmann::ordered_json doc;
    doc["year"] = key_.year;
    doc["state_code"] = key_.state_code;
    doc["district_code"] = key_.district_code;
    doc["complex_code"] = key_.complex_code;
    doc["archive_type"] = archive_name(key_.archive_type);
    doc["file_count"] = file_count_;
    doc["total_size"] = total_size_;
    doc["total_size_human"] = utils::human_readable_size(total_size_);
    doc["created_at"] = timestamp_or_null(created_at());
    doc["updated_at"] = timestamp_or_null(updated_at());

    auto parts = nlohmann::ordered_json::array();
    for (const auto &part : parts_) {
        nlohmann::ordered_json entry;
        entry["name"] = part.name;
        entry["files"] = part.files;
        entry["file_count"] = part.files.size();
        entry["size"] = part.size;
        entry["size_human"] = utils::human_readable_size(part.size);
        entry["created_at"] = part.created_at.to_iso_string();
        parts.push_back(std::move(entry));
    }
    doc["parts"] = std::move(parts);

    try {
        return doc.dump(2);
    } catch (const nlohmann::ordered_json::exception &e) {
        throw ArchiveError(ArchiveError::INDEX_ERROR,
                           "Cannot serialize Index of " + key_.to_string() +
                               ": " + e.what());
    }
}

}  // namespace dcarchive
