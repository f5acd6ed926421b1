#pragma once

#include "io/io.hpp"

#include <memory>
#include <vector>
#include <zlib.h>

namespace updsrv {

// Compresses everything written into a single gzip member on `sink`.
// Finish() must be called to flush the trailer.
class GzipWriter final : public IWriter {
  public:
    explicit GzipWriter(IWriter& sink, int level = Z_BEST_COMPRESSION);
    ~GzipWriter() override;

    GzipWriter(const GzipWriter&) = delete;
    GzipWriter& operator=(const GzipWriter&) = delete;

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;
    Result Finish();

  private:
    Result Pump(int flush);

    IWriter& sink_;
    z_stream strm_{};
    std::vector<std::uint8_t> out_buffer_;
    bool finished_ = false;
};

} // namespace updsrv
