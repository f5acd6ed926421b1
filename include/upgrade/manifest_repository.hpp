#pragma once

#include "util/manifest.hpp"
#include "util/manifest_parser.hpp"

#include <string>
#include <vector>

namespace updsrv {

inline constexpr const char kManifestDirName[] = "upgrade-manifests";

// Loads every `*.json` manifest of a directory, in file-name order.
// A missing directory is an empty set; unreadable or malformed files are
// logged and skipped.
class ManifestRepository {
  public:
    std::vector<UpgradeManifest> LoadAll(const std::string& manifests_dir) const;

    static std::string ManifestDirFor(const std::string& app_folder);

  private:
    ManifestParser parser_;
};

} // namespace updsrv
