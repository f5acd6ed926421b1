#include "upgrade/updater_updates.hpp"

#include "util/logger.hpp"

#include <climits>
#include <filesystem>

namespace updsrv {

namespace {

constexpr const char kStagedMarkerScript[] = "echo \"update-staged\" > .pending-update";

} // namespace

UpdaterUpdates::UpdaterUpdates(UpdateLocator locator, std::string updater_app, std::string staging_dir)
    : locator_(std::move(locator)),
      updater_app_(std::move(updater_app)),
      staging_dir_(std::move(staging_dir)) {}

std::optional<std::string> UpdaterUpdates::UpdaterFolder() const {
    return locator_.GetFolder(updater_app_);
}

std::optional<UpdateFileRecord> UpdaterUpdates::LatestUpdater() const {
    const auto folder = UpdaterFolder();
    if (!folder) {
        LogDebug("updater folder not found for %s", updater_app_.c_str());
        return std::nullopt;
    }
    return UpdateLocator::ScanLatest(*folder, /*include_prerelease=*/false);
}

bool UpdaterUpdates::IsUpdaterUpdateNeeded() const {
    const auto latest = LatestUpdater();
    if (!latest || !latest->version) {
        LogDebug("no versioned stable updater available");
        return false;
    }

    const bool needed = *latest->version >= kMinProtocolUpdaterVersion;
    LogInfo("updater update needed: %s (latest: %s, min: %s)",
            needed ? "true" : "false",
            latest->version->ToString().c_str(),
            kMinProtocolUpdaterVersion.ToString().c_str());
    return needed;
}

std::optional<UpgradeManifest> UpdaterUpdates::GenerateSelfUpdateManifest(
    const std::string& installer_version) const {
    auto current = AppVersion::Parse(installer_version);
    if (!current) {
        LogWarn("ignoring unparsable installer version '%s': %s",
                installer_version.c_str(), current.error().c_str());
        return std::nullopt;
    }

    const auto latest = LatestUpdater();
    if (!latest || !latest->version) return std::nullopt;
    if (*latest->version <= *current) {
        LogDebug("installer %s is current", current->ToString().c_str());
        return std::nullopt;
    }

    const std::string ver = latest->version->ToString();
    const std::string target = (std::filesystem::path(staging_dir_) / ("updater-" + ver)).string();

    UpgradeManifest m;
    m.id = "updater-self-update-" + ver;
    m.name = "Updater Self-Update " + ver;
    m.description = "Replaces the on-device updater";
    m.version = ver;
    m.type = "updater";
    m.priority = INT_MAX;
    m.post_install_script = kStagedMarkerScript;
    m.kind = SelfUpdate{.updater_version = ver, .staging_dir = target, .source_archive = latest->path};
    return m;
}

} // namespace updsrv
