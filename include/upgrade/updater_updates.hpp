#pragma once

#include "upgrade/update_locator.hpp"
#include "util/manifest.hpp"

#include <optional>
#include <string>

namespace updsrv {

// Oldest updater release that speaks the manifest-driven upgrade protocol.
inline const AppVersion kMinProtocolUpdaterVersion{2, 0, 0};

// Knows where the updater's own artifacts live and when a client's
// updater has to be replaced.
class UpdaterUpdates {
  public:
    UpdaterUpdates(UpdateLocator locator, std::string updater_app, std::string staging_dir);

    std::optional<std::string> UpdaterFolder() const;

    // Newest stable updater artifact, if any.
    std::optional<UpdateFileRecord> LatestUpdater() const;

    // True when the newest stable updater on the server is a protocol-capable
    // (>= 2.0.0) release, i.e. legacy clients should be handed one.
    bool IsUpdaterUpdateNeeded() const;

    // Synthetic self-update manifest, only when the newest stable updater is
    // strictly newer than `installer_version`.
    std::optional<UpgradeManifest> GenerateSelfUpdateManifest(const std::string& installer_version) const;

    const std::string& StagingDir() const { return staging_dir_; }

  private:
    UpdateLocator locator_;
    std::string updater_app_;
    std::string staging_dir_;
};

} // namespace updsrv
