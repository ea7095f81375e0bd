#include <dcarchive/common/logging.h>
#include <dcarchive/crawl/compressor.h>
#include <zlib.h>

#include <stdexcept>
#include <vector>

namespace dcarchive {

namespace {
constexpr std::size_t BUFFER_SIZE = 64 * 1024;
}

std::optional<std::string> GzipCompressor::compress(std::string_view data) {
    z_stream strm{};
    if (deflateInit2(&strm, level_, Z_DEFLATED, 15 + 16, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        DCARCHIVE_LOG_WARN("deflateInit2 failed, storing uncompressed");
        return std::nullopt;
    }

    std::string out;
    std::vector<unsigned char> out_buffer(BUFFER_SIZE);
    strm.next_in =
        reinterpret_cast<Bytef *>(const_cast<char *>(data.data()));
    strm.avail_in = static_cast<uInt>(data.size());

    int ret = Z_OK;
    do {
        strm.avail_out = static_cast<uInt>(BUFFER_SIZE);
        strm.next_out = out_buffer.data();
        ret = deflate(&strm, Z_FINISH);
        if (ret == Z_STREAM_ERROR) break;
        out.append(reinterpret_cast<const char *>(out_buffer.data()),
                   BUFFER_SIZE - strm.avail_out);
    } while (ret != Z_STREAM_END);
    deflateEnd(&strm);

    if (ret != Z_STREAM_END) {
        DCARCHIVE_LOG_WARN("deflate failed (%d), storing uncompressed", ret);
        return std::nullopt;
    }
    if (out.size() >= data.size()) {
        DCARCHIVE_LOG_DEBUG("Compression did not help (%zu -> %zu bytes)",
                            data.size(), out.size());
        return std::nullopt;
    }
    DCARCHIVE_LOG_DEBUG("Compressed %zu -> %zu bytes", data.size(), out.size());
    return out;
}

std::string gunzip(std::string_view data) {
    z_stream strm{};
    if (inflateInit2(&strm, 15 + 16) != Z_OK) {
        throw std::runtime_error("inflateInit2 failed");
    }

    std::string out;
    std::vector<unsigned char> out_buffer(BUFFER_SIZE);
    strm.next_in =
        reinterpret_cast<Bytef *>(const_cast<char *>(data.data()));
    strm.avail_in = static_cast<uInt>(data.size());

    int ret = Z_OK;
    do {
        strm.avail_out = static_cast<uInt>(BUFFER_SIZE);
        strm.next_out = out_buffer.data();
        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&strm);
            throw std::runtime_error("Corrupt gzip stream (" +
                                     std::to_string(ret) + ")");
        }
        out.append(reinterpret_cast<const char *>(out_buffer.data()),
                   BUFFER_SIZE - strm.avail_out);
    } while (ret != Z_STREAM_END &&
             (strm.avail_in > 0 || strm.avail_out == 0));
    inflateEnd(&strm);

    if (ret != Z_STREAM_END) {
        throw std::runtime_error("Truncated gzip stream");
    }
    return out;
}

}  // namespace dcarchive
