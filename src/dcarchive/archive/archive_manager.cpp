#include <dcarchive/archive/archive_manager.h>
#include <dcarchive/archive/tar_packer.h>
#include <dcarchive/common/error.h>
#include <dcarchive/common/logging.h>
#include <dcarchive/utils/file.h>
#include <dcarchive/utils/json.h>

#include <cstdio>
#include <iterator>
#include <system_error>

namespace dcarchive {

ArchiveManager::ArchiveManager(ArchiveConfig config,
                               std::shared_ptr<ObjectStore> store)
    : config_(std::move(config)),
      store_(std::move(store)),
      rng_(std::random_device{}()) {
    if (!config_.local_only && !store_) {
        throw ArchiveError(ArchiveError::INVALID_ARGUMENT,
                           "A remote object store is required unless "
                           "running local-only");
    }
    DCARCHIVE_LOG_DEBUG(
        "Archive manager: local_dir=%s remote=%s prefix='%s' mode=%s",
        config_.local_dir.c_str(),
        config_.local_only ? "none" : store_->describe().c_str(),
        config_.prefix.c_str(),
        config_.local_only
            ? "local-only"
            : (config_.immediate_upload ? "immediate" : "batch"));
}

ArchiveManager::~ArchiveManager() {
    try {
        close();
    } catch (const std::exception &e) {
        DCARCHIVE_LOG_ERROR("Archive close failed, staged data may be lost: %s",
                            e.what());
    }
}

ArchiveManager::PartitionState &ArchiveManager::state_for(
    const PartitionKey &key) {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto &slot = partitions_[key];
    if (!slot) {
        slot = std::make_unique<PartitionState>();
    }
    return *slot;
}

PartitionIndex ArchiveManager::load_index(const PartitionKey &key) {
    std::optional<std::string> text;
    if (config_.local_only) {
        try {
            text = utils::read_file(key.local_index_path(config_.local_dir));
        } catch (const std::runtime_error &e) {
            throw ArchiveError(ArchiveError::INDEX_ERROR, e.what());
        }
    } else {
        text = store_->get(key.remote_index_key(config_.prefix));
    }

    if (!text) {
        DCARCHIVE_LOG_DEBUG("No Index for %s, starting empty",
                            key.to_string().c_str());
        return PartitionIndex(key);
    }
    auto index = PartitionIndex::from_json(key, *text);
    DCARCHIVE_LOG_DEBUG("Loaded Index for %s: %zu parts, %llu files",
                        key.to_string().c_str(), index.parts().size(),
                        static_cast<unsigned long long>(index.file_count()));
    return index;
}

void ArchiveManager::ensure_loaded(const PartitionKey &key,
                                   PartitionState &state) {
    if (!state.index) {
        state.index = load_index(key);
    }
}

bool ArchiveManager::exists(const PartitionKey &key,
                            const std::string &filename) {
    auto &state = state_for(key);
    std::lock_guard<std::mutex> lock(state.mutex);
    if (state.staged_names.count(filename) > 0) return true;
    ensure_loaded(key, state);
    return state.index->contains(filename);
}

void ArchiveManager::put(const PartitionKey &key, const std::string &filename,
                         std::string content) {
    if (closed_.load()) {
        throw ArchiveError(ArchiveError::CLOSED_ERROR,
                           "put after close: " + key.to_string() + "/" +
                               filename);
    }
    if (filename.empty()) {
        throw ArchiveError(ArchiveError::INVALID_ARGUMENT,
                           "Empty filename for " + key.to_string());
    }
    if (!json::is_valid_utf8(filename)) {
        throw ArchiveError(ArchiveError::INVALID_ARGUMENT,
                           "Filename for " + key.to_string() +
                               " is not valid UTF-8");
    }

    auto &state = state_for(key);
    std::lock_guard<std::mutex> lock(state.mutex);
    if (state.staged_names.count(filename) > 0 ||
        (state.index && state.index->contains(filename))) {
        DCARCHIVE_LOG_WARN("%s already exists in %s; check exists() first",
                           filename.c_str(), key.to_string().c_str());
    }
    state.staged_names.insert(filename);
    state.staging.emplace_back(filename, std::move(content));
}

std::string ArchiveManager::make_part_name(ArchiveType type,
                                           const Timestamp &now) {
    std::uint32_t suffix;
    {
        std::lock_guard<std::mutex> lock(rng_mutex_);
        suffix = static_cast<std::uint32_t>(rng_());
    }
    char hex[16];
    std::snprintf(hex, sizeof(hex), "%08x", suffix);
    return std::string(archive_name(type)) + "-part-" +
           now.to_compact_string() + "-" + hex +
           constants::archive::PART_SUFFIX;
}

bool ArchiveManager::flush_locked(const PartitionKey &key,
                                  PartitionState &state) {
    if (state.staging.empty()) {
        return false;
    }
    ensure_loaded(key, state);

    Timestamp now = Timestamp::now(config_.utc_offset_minutes);
    std::string part_name = make_part_name(key.archive_type, now);

    TarPacker packer(now.epoch_micros() / 1000000);
    PartDescriptor part;
    part.name = part_name;
    part.created_at = now;
    part.files.reserve(state.staging.size());
    for (const auto &blob : state.staging) {
        packer.add(blob.first, blob.second);
        part.files.push_back(blob.first);
    }
    std::string container = packer.finish();
    part.size = container.size();

    PartitionIndex next = *state.index;
    next.append_part(part);
    std::string index_json = next.to_json();

    // 1. Part, locally
    fs::path local_part = key.local_dir(config_.local_dir) / part_name;
    try {
        utils::write_file_atomic(local_part, container);
    } catch (const std::runtime_error &e) {
        throw ArchiveError(ArchiveError::FLUSH_ERROR,
                           "Cannot write Part for " + key.to_string() + ": " +
                               e.what());
    }

    bool upload_now = !config_.local_only && config_.immediate_upload;
    if (upload_now) {
        // 2. Part, remotely
        try {
            store_->put(key.remote_part_key(config_.prefix, part_name),
                        container);
        } catch (const ArchiveError &e) {
            std::error_code ignored;
            fs::remove(local_part, ignored);
            throw ArchiveError(ArchiveError::FLUSH_ERROR,
                               "Part upload failed for " + key.to_string() +
                                   ", staging kept: " + e.what());
        }
        // 3. Index, remotely. A failure here orphans the uploaded Part.
        try {
            store_->put(key.remote_index_key(config_.prefix), index_json);
        } catch (const ArchiveError &e) {
            throw ArchiveError(ArchiveError::FLUSH_ERROR,
                               "Index upload failed for " + key.to_string() +
                                   " after Part " + part_name +
                                   ", staging kept: " + e.what());
        }
    }

    // 4. Index, locally
    try {
        utils::write_file_atomic(key.local_index_path(config_.local_dir),
                                 index_json);
    } catch (const std::runtime_error &e) {
        if (config_.local_only || !upload_now) {
            throw ArchiveError(ArchiveError::FLUSH_ERROR,
                               "Cannot write Index for " + key.to_string() +
                                   ": " + e.what());
        }
        // The remote Index already records the Part
        DCARCHIVE_LOG_WARN("Local Index copy for %s not written: %s",
                           key.to_string().c_str(), e.what());
    }

    if (!config_.local_only && !config_.immediate_upload) {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_parts_.push_back(PendingPart{key, part_name, local_part});
        pending_indexes_.insert(key);
    }

    // 5. Commit
    state.index = std::move(next);
    {
        std::lock_guard<std::mutex> lock(changes_mutex_);
        auto &files = changes_[key.location()][archive_name(key.archive_type)];
        files.insert(files.end(), part.files.begin(), part.files.end());
    }
    state.staging.clear();
    state.staged_names.clear();

    DCARCHIVE_LOG_INFO("Flushed %zu files to %s (%s)", part.files.size(),
                       key.remote_part_key(config_.prefix, part_name).c_str(),
                       utils::human_readable_size(part.size).c_str());
    return true;
}

bool ArchiveManager::flush(const PartitionKey &key) {
    if (closed_.load()) {
        throw ArchiveError(ArchiveError::CLOSED_ERROR,
                           "flush after close: " + key.to_string());
    }
    auto &state = state_for(key);
    std::lock_guard<std::mutex> lock(state.mutex);
    return flush_locked(key, state);
}

std::size_t ArchiveManager::flush_all() {
    std::vector<std::pair<PartitionKey, PartitionState *>> snapshot;
    {
        std::lock_guard<std::mutex> lock(map_mutex_);
        for (auto &entry : partitions_) {
            snapshot.emplace_back(entry.first, entry.second.get());
        }
    }

    std::size_t written = 0;
    std::vector<std::string> failures;
    for (auto &entry : snapshot) {
        std::lock_guard<std::mutex> lock(entry.second->mutex);
        try {
            if (flush_locked(entry.first, *entry.second)) ++written;
        } catch (const ArchiveError &e) {
            DCARCHIVE_LOG_ERROR("Flush of %s failed: %s",
                                entry.first.to_string().c_str(), e.what());
            failures.push_back(entry.first.to_string() + ": " + e.what());
        }
    }

    if (!failures.empty()) {
        std::string message = std::to_string(failures.size()) +
                              " partition(s) failed to flush";
        for (const auto &failure : failures) {
            message += "; " + failure;
        }
        throw ArchiveError(ArchiveError::FLUSH_ERROR, message);
    }
    return written;
}

void ArchiveManager::upload_pending() {
    std::vector<PendingPart> parts;
    std::set<PartitionKey> indexes;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        parts.swap(pending_parts_);
        indexes.swap(pending_indexes_);
    }
    if (parts.empty() && indexes.empty()) return;

    DCARCHIVE_LOG_INFO("Uploading %zu pending Parts", parts.size());

    std::vector<PendingPart> failed_parts;
    std::set<PartitionKey> blocked;
    for (auto &pending : parts) {
        try {
            store_->put_file(
                pending.key.remote_part_key(config_.prefix, pending.part_name),
                pending.local_path);
        } catch (const ArchiveError &e) {
            DCARCHIVE_LOG_ERROR("Upload of %s failed: %s",
                                pending.local_path.c_str(), e.what());
            blocked.insert(pending.key);
            failed_parts.push_back(std::move(pending));
        }
    }

    std::set<PartitionKey> failed_indexes;
    for (const auto &key : indexes) {
        // An Index must never reference a Part that is not uploaded yet
        if (blocked.count(key) > 0) {
            failed_indexes.insert(key);
            continue;
        }
        std::string index_json;
        {
            auto &state = state_for(key);
            std::lock_guard<std::mutex> lock(state.mutex);
            index_json = state.index->to_json();
        }
        try {
            store_->put(key.remote_index_key(config_.prefix), index_json);
        } catch (const ArchiveError &e) {
            DCARCHIVE_LOG_ERROR("Index upload for %s failed: %s",
                                key.to_string().c_str(), e.what());
            failed_indexes.insert(key);
        }
    }

    if (!failed_parts.empty() || !failed_indexes.empty()) {
        std::size_t failures = failed_parts.size() + failed_indexes.size();
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            pending_parts_.insert(pending_parts_.end(),
                                  std::make_move_iterator(failed_parts.begin()),
                                  std::make_move_iterator(failed_parts.end()));
            pending_indexes_.insert(failed_indexes.begin(),
                                    failed_indexes.end());
        }
        throw ArchiveError(ArchiveError::STORAGE_ERROR,
                           std::to_string(failures) +
                               " pending upload(s) failed");
    }
}

void ArchiveManager::close() {
    if (closed_.load()) return;

    std::string error;
    try {
        flush_all();
    } catch (const ArchiveError &e) {
        error = e.what();
    }
    if (!config_.local_only) {
        try {
            upload_pending();
        } catch (const ArchiveError &e) {
            error += error.empty() ? e.what() : std::string("; ") + e.what();
        }
    }
    if (!error.empty()) {
        throw ArchiveError(ArchiveError::FLUSH_ERROR, "close: " + error);
    }

    closed_.store(true);
    DCARCHIVE_LOG_DEBUG("Archive manager closed");
}

ChangeLog ArchiveManager::changes() const {
    std::lock_guard<std::mutex> lock(changes_mutex_);
    return changes_;
}

PartitionIndex ArchiveManager::index_snapshot(const PartitionKey &key) {
    auto &state = state_for(key);
    std::lock_guard<std::mutex> lock(state.mutex);
    ensure_loaded(key, state);
    return *state.index;
}

std::size_t ArchiveManager::staged_count(const PartitionKey &key) {
    auto &state = state_for(key);
    std::lock_guard<std::mutex> lock(state.mutex);
    return state.staging.size();
}

std::vector<PartitionKey> ArchiveManager::dirty_partitions() {
    std::vector<std::pair<PartitionKey, PartitionState *>> snapshot;
    {
        std::lock_guard<std::mutex> lock(map_mutex_);
        for (auto &entry : partitions_) {
            snapshot.emplace_back(entry.first, entry.second.get());
        }
    }
    std::vector<PartitionKey> dirty;
    for (auto &entry : snapshot) {
        std::lock_guard<std::mutex> lock(entry.second->mutex);
        if (!entry.second->staging.empty()) dirty.push_back(entry.first);
    }
    return dirty;
}

}  // namespace dcarchive
