#pragma once

#include "util/result.hpp"

#include <filesystem>
#include <string>

namespace updsrv {

// Maps raw archive entry names to paths under an extraction root.
class ArchivePathPolicy {
  public:
    explicit ArchivePathPolicy(std::filesystem::path root) : root_(std::move(root)) {}

    // Fails with InvalidInput when the entry would land outside the root.
    // An empty `out_relative` means the entry names the root itself.
    Result ResolveEntryPath(const std::string& raw_path,
                            std::string& out_relative,
                            std::filesystem::path& out_absolute) const;

  private:
    std::filesystem::path root_;
};

} // namespace updsrv
