#pragma once

#include "archive/tar_stream_extractor.hpp"
#include "util/cancel.hpp"
#include "util/result.hpp"

#include <string>

namespace updsrv {

// TAR + gzip, the archive format exchanged with client updaters.
class TarCodec {
  public:
    explicit TarCodec(CancelToken cancel = {}) : cancel_(std::move(cancel)) {}

    // Archives every regular file under `source_dir` into `output_path`.
    // A partially written output is removed on failure.
    Result CreateTarGz(const std::string& source_dir, const std::string& output_path) const;

    Result ExtractTarGz(const std::string& archive_path,
                        const std::string& dest_dir,
                        TarStreamExtractor::Stats* stats = nullptr) const;

  private:
    CancelToken cancel_;
};

} // namespace updsrv
