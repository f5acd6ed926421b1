#pragma once

#include "io/io.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <zlib.h>

namespace updsrv {

// Inflates a gzip stream (a single member) from `source`.
class GzipReader final : public IReader {
  public:
    explicit GzipReader(std::unique_ptr<IReader> source);
    ~GzipReader() override;

    GzipReader(const GzipReader&) = delete;
    GzipReader& operator=(const GzipReader&) = delete;

    ssize_t Read(std::span<std::uint8_t> out) override;

    // Why the last Read returned -1; empty while the stream is healthy.
    const std::string& LastError() const { return error_; }

    // Compressed bytes consumed from the source so far.
    std::uint64_t CompressedBytes() const { return strm_.total_in; }

  private:
    ssize_t Fail(std::string why);

    std::unique_ptr<IReader> source_;
    z_stream strm_{};
    std::vector<std::uint8_t> in_buffer_;
    bool eof_reached_ = false;
    std::string error_;
};

} // namespace updsrv
