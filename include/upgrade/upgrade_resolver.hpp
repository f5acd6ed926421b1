#pragma once

#include "upgrade/manifest_repository.hpp"
#include "upgrade/update_locator.hpp"
#include "upgrade/updater_updates.hpp"
#include "util/manifest.hpp"
#include "util/result.hpp"
#include "util/version.hpp"

#include <optional>
#include <string>

namespace updsrv {

inline constexpr int kAppUpdatePriority = 100;

class UpgradeResolver {
  public:
    UpgradeResolver(UpdateLocator locator, UpdaterUpdates updater);

    // Ordered set of upgrades that takes a client at `client_version` to the
    // newest version on the selected track. An empty `out.upgrades` means the
    // client is current.
    //
    // NotFound: unknown app or no versioned update file.
    // DependencyCycle: manifests form a cycle; nothing is returned.
    Result GetApplicableUpgrades(const std::string& app_name,
                                 const AppVersion& client_version,
                                 bool include_prerelease,
                                 const std::optional<std::string>& installer_version,
                                 ApplicableUpgradesResult& out) const;

    // [min, max) minus the excluded versions. Unparsable bounds make the
    // range match nothing.
    static bool IsVersionInRange(const AppVersion& version, const std::optional<VersionRange>& range);

    const UpdateLocator& Locator() const { return locator_; }
    const UpdaterUpdates& Updater() const { return updater_; }

  private:
    UpgradeManifest MakeAppUpdateManifest(const UpdateFileRecord& latest) const;

    // Points app and updater manifests read from disk at the artifacts they
    // ship. False when there is nothing to ship.
    bool BindArtifacts(UpgradeManifest& manifest, const UpdateFileRecord& latest) const;

    UpdateLocator locator_;
    UpdaterUpdates updater_;
    ManifestRepository repository_;
};

} // namespace updsrv
