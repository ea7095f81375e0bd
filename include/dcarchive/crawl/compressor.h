#ifndef DCARCHIVE_CRAWL_COMPRESSOR_H
#define DCARCHIVE_CRAWL_COMPRESSOR_H

#include <optional>
#include <string>
#include <string_view>

namespace dcarchive {

class Compressor {
   public:
    virtual ~Compressor() = default;

    /**
     * @return compressed bytes, or std::nullopt when compression failed or
     *         did not make the input smaller; callers keep the original then
     */
    virtual std::optional<std::string> compress(std::string_view data) = 0;

    // Appended to the stored filename when compress() returned bytes
    virtual const char *extension() const = 0;
};

// gzip framing through zlib
class GzipCompressor : public Compressor {
   public:
    explicit GzipCompressor(int level = -1) : level_(level) {}

    std::optional<std::string> compress(std::string_view data) override;
    const char *extension() const override { return ".gz"; }

   private:
    int level_;
};

// Inverse of GzipCompressor::compress
// @throws std::runtime_error on a corrupt stream
std::string gunzip(std::string_view data);

}  // namespace dcarchive

#endif  // DCARCHIVE_CRAWL_COMPRESSOR_H
