#pragma once

#include "io/io.hpp"
#include "util/cancel.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace updsrv {

// Unpacks a TAR stream onto disk through libarchive. Only regular files and
// directories are materialized; links and special files are skipped.
class TarStreamExtractor {
  public:
    struct Stats {
        std::uint64_t files_written = 0;
        std::uint64_t bytes_written = 0;
        std::vector<std::string> skipped;   // entries rejected by the path policy
    };

    TarStreamExtractor() = default;
    explicit TarStreamExtractor(CancelToken cancel) : cancel_(std::move(cancel)) {}

    // Entries resolving outside `dst_dir` are skipped and extraction goes on.
    // A stream ending without the zero trailer is accepted.
    Result ExtractToDir(IReader& tar_stream,
                        const std::string& dst_dir,
                        std::string_view tag,
                        Stats* stats = nullptr) const;

  private:
    CancelToken cancel_;
};

} // namespace updsrv
