#include <dcarchive/utils/file.h>
#include <unistd.h>

#include <atomic>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace dcarchive::utils {

std::optional<std::string> read_file(const fs::path &path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::nullopt;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open file for reading: " +
                                 path.string());
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw std::runtime_error("Failed to read file: " + path.string());
    }
    return buffer.str();
}

fs::path unique_temp_path(const fs::path &path) {
    static std::atomic<std::uint64_t> counter{0};
    fs::path tmp = path;
    tmp += ".tmp." + std::to_string(::getpid()) + "." +
           std::to_string(counter.fetch_add(1));
    return tmp;
}

void write_file_atomic(const fs::path &path, const std::string &data) {
    fs::path parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw std::runtime_error("Cannot create directory " +
                                     parent.string() + ": " + ec.message());
        }
    }

    fs::path tmp = unique_temp_path(path);

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("Cannot open file for writing: " +
                                     tmp.string());
        }
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out) {
            out.close();
            std::error_code ignored;
            fs::remove(tmp, ignored);
            throw std::runtime_error("Failed to write file: " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw std::runtime_error("Cannot rename " + tmp.string() + " to " +
                                 path.string() + ": " + ec.message());
    }
}

std::optional<FileStamp> get_file_stamp(const fs::path &path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) return std::nullopt;
    auto mtime = fs::last_write_time(path, ec);
    if (ec) return std::nullopt;
    return FileStamp{size, mtime};
}

std::string human_readable_size(std::uint64_t size_bytes) {
    static const char *units[] = {"B", "KB", "MB", "GB"};
    double size = static_cast<double>(size_bytes);
    char buffer[64];
    for (const char *unit : units) {
        if (size < 1024.0) {
            std::snprintf(buffer, sizeof(buffer), "%.2f %s", size, unit);
            return buffer;
        }
        size /= 1024.0;
    }
    std::snprintf(buffer, sizeof(buffer), "%.2f TB", size);
    return buffer;
}

}  // namespace dcarchive::utils
