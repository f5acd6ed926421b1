#pragma once

#include "upgrade/package_cache.hpp"
#include "upgrade/upgrade_resolver.hpp"
#include "util/cancel.hpp"
#include "util/manifest.hpp"
#include "util/result.hpp"
#include "util/version.hpp"

#include <optional>
#include <string>
#include <vector>

namespace updsrv {

// Assembles resolved upgrades into a cached `.tar.gz`:
//
//   upgrade/package-manifest.json
//   upgrade/upgrades/<id>/manifest.json
//   upgrade/upgrades/<id>/<payload...>
class PackageBuilder {
  public:
    PackageBuilder(const UpgradeResolver& resolver,
                   PackageCache& cache,
                   std::string upgrade_root,
                   std::string scratch_root,
                   CancelToken cancel = {});

    // NotFound when the app is unknown or there is nothing to install.
    // `from_cache`, when given, tells whether an existing archive was served.
    Result BuildUpgradePackage(const std::string& app_name,
                               const AppVersion& client_version,
                               bool include_prerelease,
                               const std::optional<std::string>& installer_version,
                               std::string& out_path,
                               bool* from_cache = nullptr) const;

    // Writes the package tree for `upgrades` below `staging_root`, filling in
    // the file directives of synthetic manifests.
    Result Stage(std::vector<UpgradeManifest>& upgrades,
                 const PackageManifest& package,
                 const std::string& staging_root) const;

    // `storage.basePath` (or the upgrade root) joined with `storage.path`.
    std::string SourcePathFor(const UpgradeManifest& manifest) const;

  private:
    Result StageOne(UpgradeManifest& upgrade, const std::string& dest_dir) const;

    const UpgradeResolver& resolver_;
    PackageCache& cache_;
    std::string upgrade_root_;
    std::string scratch_root_;
    CancelToken cancel_;
};

} // namespace updsrv
