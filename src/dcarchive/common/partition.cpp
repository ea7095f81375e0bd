#include <dcarchive/common/constants.h>
#include <dcarchive/common/partition.h>

#include <cstdlib>
#include <functional>
#include <tuple>
#include <vector>

namespace dcarchive {

using namespace constants::archive;

const char *archive_name(ArchiveType type) {
    return type == ArchiveType::DOCUMENT ? DOCUMENT_ARCHIVE : METADATA_ARCHIVE;
}

const char *storage_root(ArchiveType type) {
    return type == ArchiveType::DOCUMENT ? DOCUMENT_ROOT : METADATA_ROOT;
}

std::optional<ArchiveType> parse_archive_type(std::string_view name) {
    if (name == METADATA_ARCHIVE) return ArchiveType::METADATA;
    if (name == DOCUMENT_ARCHIVE || name == "document") {
        return ArchiveType::DOCUMENT;
    }
    return std::nullopt;
}

std::string PartitionKey::location() const {
    return "year=" + std::to_string(year) + "/state=" + state_code +
           "/district=" + district_code + "/complex=" + complex_code;
}

std::string PartitionKey::remote_dir(const std::string &prefix) const {
    return prefix + storage_root(archive_type) + "/" + CONTAINER_DIR + "/" +
           location() + "/";
}

std::string PartitionKey::remote_part_key(const std::string &prefix,
                                          const std::string &part_name) const {
    return remote_dir(prefix) + part_name;
}

std::string PartitionKey::remote_index_key(const std::string &prefix) const {
    return remote_dir(prefix) + archive_name(archive_type) + INDEX_SUFFIX;
}

fs::path PartitionKey::local_dir(const fs::path &local_root) const {
    return local_root / std::to_string(year) / state_code / district_code /
           complex_code;
}

fs::path PartitionKey::local_index_path(const fs::path &local_root) const {
    return local_dir(local_root) /
           (std::string(archive_name(archive_type)) + INDEX_SUFFIX);
}

std::string PartitionKey::to_string() const {
    return location() + "/" + archive_name(archive_type);
}

bool PartitionKey::operator==(const PartitionKey &other) const {
    return year == other.year && state_code == other.state_code &&
           district_code == other.district_code &&
           complex_code == other.complex_code &&
           archive_type == other.archive_type;
}

bool PartitionKey::operator<(const PartitionKey &other) const {
    return std::tie(year, state_code, district_code, complex_code,
                    archive_type) < std::tie(other.year, other.state_code,
                                             other.district_code,
                                             other.complex_code,
                                             other.archive_type);
}

std::size_t PartitionKeyHash::operator()(const PartitionKey &key) const {
    std::size_t h = std::hash<int>{}(key.year);
    auto mix = [&h](std::size_t v) {
        h ^= v + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    };
    mix(std::hash<std::string>{}(key.state_code));
    mix(std::hash<std::string>{}(key.district_code));
    mix(std::hash<std::string>{}(key.complex_code));
    mix(static_cast<std::size_t>(key.archive_type));
    return h;
}

namespace {

std::vector<std::string> split(const std::string &text, char sep) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        auto pos = text.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

bool take_component(const std::string &part, const std::string &name,
                    std::string &value) {
    std::string label = name + "=";
    if (part.compare(0, label.size(), label) != 0) return false;
    value = part.substr(label.size());
    return !value.empty();
}

}  // namespace

std::optional<RemoteObject> parse_remote_key(const std::string &key,
                                             const std::string &prefix) {
    if (key.compare(0, prefix.size(), prefix) != 0) return std::nullopt;

    // root / tar / year / state / district / complex / file
    auto parts = split(key.substr(prefix.size()), '/');
    if (parts.size() != 7 || parts[1] != CONTAINER_DIR) return std::nullopt;

    RemoteObject object;
    if (parts[0] == METADATA_ROOT) {
        object.partition.archive_type = ArchiveType::METADATA;
    } else if (parts[0] == DOCUMENT_ROOT) {
        object.partition.archive_type = ArchiveType::DOCUMENT;
    } else {
        return std::nullopt;
    }

    std::string year;
    if (!take_component(parts[2], "year", year) ||
        !take_component(parts[3], "state", object.partition.state_code) ||
        !take_component(parts[4], "district",
                        object.partition.district_code) ||
        !take_component(parts[5], "complex", object.partition.complex_code)) {
        return std::nullopt;
    }
    char *end = nullptr;
    long parsed_year = std::strtol(year.c_str(), &end, 10);
    if (end == year.c_str() || *end != '\0') return std::nullopt;
    object.partition.year = static_cast<int>(parsed_year);

    object.filename = parts[6];
    if (object.filename.empty()) return std::nullopt;
    return object;
}

}  // namespace dcarchive
