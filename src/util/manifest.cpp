#include "util/manifest.hpp"

namespace updsrv {

std::uint64_t UpgradeManifest::TotalFileSize() const {
    std::uint64_t total = 0;
    for (const auto& f : files) total += f.size;
    return total;
}

} // namespace updsrv
