#include "io/gzip_reader.hpp"

#include <stdexcept>

namespace updsrv {

GzipReader::GzipReader(std::unique_ptr<IReader> source)
    : source_(std::move(source)), in_buffer_(64 * 1024) {
    strm_.zalloc = Z_NULL;
    strm_.zfree = Z_NULL;
    strm_.opaque = Z_NULL;
    strm_.avail_in = 0;
    strm_.next_in = Z_NULL;

    // 16 + MAX_WBITS: expect a gzip header, reject raw zlib streams
    if (inflateInit2(&strm_, 16 + MAX_WBITS) != Z_OK) {
        throw std::runtime_error("Failed to initialize zlib inflate");
    }
}

GzipReader::~GzipReader() {
    inflateEnd(&strm_);
}

ssize_t GzipReader::Fail(std::string why) {
    error_ = std::move(why);
    return -1;
}

ssize_t GzipReader::Read(std::span<std::uint8_t> out) {
    if (!error_.empty()) return -1;
    if (eof_reached_ || out.empty()) return 0;

    strm_.next_out = out.data();
    strm_.avail_out = static_cast<uInt>(out.size());

    while (strm_.avail_out > 0) {
        if (strm_.avail_in == 0) {
            const ssize_t n = source_->Read(in_buffer_);
            if (n < 0) return Fail("read error on compressed input");
            if (n == 0) {
                // Source ended before the gzip trailer.
                if (out.size() == strm_.avail_out) return Fail("unexpected end of gzip stream");
                break;
            }
            strm_.avail_in = static_cast<uInt>(n);
            strm_.next_in = in_buffer_.data();
        }

        const int ret = inflate(&strm_, Z_NO_FLUSH);
        if (ret == Z_STREAM_END) {
            eof_reached_ = true;
            break;
        }
        // Z_BUF_ERROR only means more input or output space is needed.
        if (ret != Z_OK && ret != Z_BUF_ERROR) {
            return Fail(std::string("gzip: ") + (strm_.msg ? strm_.msg : zError(ret)));
        }
    }

    return static_cast<ssize_t>(out.size() - strm_.avail_out);
}

} // namespace updsrv
