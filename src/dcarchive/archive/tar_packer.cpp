#include <dcarchive/archive/tar_packer.h>
#include <dcarchive/common/constants.h>
#include <dcarchive/common/error.h>
#include <dcarchive/common/logging.h>
#include <archive.h>
#include <archive_entry.h>

#include <functional>
#include <vector>

namespace dcarchive {

namespace {

struct ReaderDeleter {
    void operator()(struct archive *reader) const { archive_read_free(reader); }
};
using ReaderPtr = std::unique_ptr<struct archive, ReaderDeleter>;

struct EntryDeleter {
    void operator()(struct archive_entry *entry) const {
        archive_entry_free(entry);
    }
};

la_ssize_t append_to_buffer(struct archive *, void *client, const void *buffer,
                            size_t length) {
    static_cast<std::string *>(client)->append(
        static_cast<const char *>(buffer), length);
    return static_cast<la_ssize_t>(length);
}

std::string error_string(struct archive *a) {
    const char *message = archive_error_string(a);
    return message ? message : "unknown libarchive error";
}

[[noreturn]] void fail(struct archive *a, const std::string &what) {
    throw ArchiveError(ArchiveError::PACKER_ERROR,
                       what + ": " + error_string(a));
}

ReaderPtr new_reader() {
    ReaderPtr reader(archive_read_new());
    if (!reader) {
        throw ArchiveError(ArchiveError::PACKER_ERROR,
                           "Cannot allocate a tar reader");
    }
    archive_read_support_format_tar(reader.get());
    return reader;
}

ReaderPtr open_memory(const std::string &data) {
    auto reader = new_reader();
    if (archive_read_open_memory(reader.get(), data.data(), data.size()) !=
        ARCHIVE_OK) {
        fail(reader.get(), "Not a tar container");
    }
    return reader;
}

std::string entry_name(struct archive_entry *entry) {
    const char *name = archive_entry_pathname_utf8(entry);
    if (name == nullptr) name = archive_entry_pathname(entry);
    return name ? name : "";
}

std::string read_entry_data(struct archive *reader,
                            struct archive_entry *entry) {
    std::string data;
    if (archive_entry_size_is_set(entry) && archive_entry_size(entry) > 0) {
        data.reserve(static_cast<std::size_t>(archive_entry_size(entry)));
    }
    std::vector<char> chunk(constants::tar::RECORD_SIZE);
    while (true) {
        la_ssize_t n = archive_read_data(reader, chunk.data(), chunk.size());
        if (n < 0) fail(reader, "Cannot read member " + entry_name(entry));
        if (n == 0) break;
        data.append(chunk.data(), static_cast<std::size_t>(n));
    }
    return data;
}

// Visit every regular-file member; directories and links are skipped
void walk_tar(struct archive *reader,
              const std::function<void(struct archive_entry *)> &visit) {
    struct archive_entry *entry = nullptr;
    while (true) {
        int status = archive_read_next_header(reader, &entry);
        if (status == ARCHIVE_EOF) break;
        if (status == ARCHIVE_WARN) {
            DCARCHIVE_LOG_WARN("tar: %s", error_string(reader).c_str());
        } else if (status != ARCHIVE_OK) {
            fail(reader, "Damaged tar container");
        }
        if (archive_entry_filetype(entry) != AE_IFREG) {
            DCARCHIVE_LOG_DEBUG("Skipping non-file member %s",
                                entry_name(entry).c_str());
            continue;
        }
        visit(entry);
    }
}

std::vector<TarMember> collect_members(struct archive *reader) {
    std::vector<TarMember> members;
    walk_tar(reader, [&](struct archive_entry *entry) {
        TarMember member;
        member.name = entry_name(entry);
        member.mtime = archive_entry_mtime(entry);
        member.data = read_entry_data(reader, entry);
        members.push_back(std::move(member));
    });
    return members;
}

}  // namespace

void TarPacker::WriterDeleter::operator()(struct archive *writer) const {
    archive_write_free(writer);
}

TarPacker::TarPacker(std::int64_t mtime_seconds) : mtime_(mtime_seconds) {}

TarPacker::~TarPacker() = default;

void TarPacker::open() {
    writer_.reset(archive_write_new());
    if (!writer_) {
        throw ArchiveError(ArchiveError::PACKER_ERROR,
                           "Cannot allocate a tar writer");
    }
    struct archive *w = writer_.get();
    if (archive_write_set_format_pax_restricted(w) != ARCHIVE_OK ||
        archive_write_add_filter_none(w) != ARCHIVE_OK ||
        archive_write_set_bytes_per_block(
            w, static_cast<int>(constants::tar::RECORD_SIZE)) != ARCHIVE_OK ||
        archive_write_set_bytes_in_last_block(
            w, static_cast<int>(constants::tar::RECORD_SIZE)) != ARCHIVE_OK) {
        fail(w, "Cannot configure tar writer");
    }
    buffer_.clear();
    if (archive_write_open(w, &buffer_, nullptr, append_to_buffer, nullptr) !=
        ARCHIVE_OK) {
        fail(w, "Cannot open tar writer");
    }
}

void TarPacker::add(const std::string &name, const std::string &data) {
    if (!writer_) open();

    std::unique_ptr<struct archive_entry, EntryDeleter> entry(
        archive_entry_new());
    archive_entry_set_pathname_utf8(entry.get(), name.c_str());
    archive_entry_set_filetype(entry.get(), AE_IFREG);
    archive_entry_set_perm(entry.get(), 0644);
    archive_entry_set_size(entry.get(), static_cast<la_int64_t>(data.size()));
    archive_entry_set_mtime(entry.get(), static_cast<time_t>(mtime_), 0);

    int status = archive_write_header(writer_.get(), entry.get());
    if (status == ARCHIVE_WARN) {
        DCARCHIVE_LOG_WARN("tar header for %s: %s", name.c_str(),
                           error_string(writer_.get()).c_str());
    } else if (status != ARCHIVE_OK) {
        fail(writer_.get(), "Cannot add " + name);
    }

    if (!data.empty()) {
        la_ssize_t written =
            archive_write_data(writer_.get(), data.data(), data.size());
        if (written < 0 || static_cast<std::size_t>(written) != data.size()) {
            fail(writer_.get(), "Short write for " + name);
        }
    }
    ++member_count_;
}

std::string TarPacker::finish() {
    if (!writer_) open();
    if (archive_write_close(writer_.get()) != ARCHIVE_OK) {
        fail(writer_.get(), "Cannot finish tar container");
    }
    writer_.reset();

    std::string container;
    container.swap(buffer_);
    member_count_ = 0;
    return container;
}

std::vector<TarMember> read_tar(const std::string &data) {
    auto reader = open_memory(data);
    return collect_members(reader.get());
}

std::vector<TarMember> read_tar_file(const fs::path &path) {
    auto reader = new_reader();
    if (archive_read_open_filename(
            reader.get(), path.c_str(),
            constants::tar::RECORD_SIZE) != ARCHIVE_OK) {
        fail(reader.get(), "Cannot open container " + path.string());
    }
    return collect_members(reader.get());
}

std::vector<std::string> list_tar_names(const std::string &data) {
    auto reader = open_memory(data);
    std::vector<std::string> names;
    walk_tar(reader.get(), [&](struct archive_entry *entry) {
        names.push_back(entry_name(entry));
    });
    return names;
}

}  // namespace dcarchive
