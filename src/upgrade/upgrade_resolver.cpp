#include "upgrade/upgrade_resolver.hpp"

#include "upgrade/upgrade_order.hpp"
#include "util/logger.hpp"

#include <filesystem>

namespace updsrv {

UpgradeResolver::UpgradeResolver(UpdateLocator locator, UpdaterUpdates updater)
    : locator_(std::move(locator)), updater_(std::move(updater)) {}

bool UpgradeResolver::IsVersionInRange(const AppVersion& version, const std::optional<VersionRange>& range) {
    if (!range) return true;

    if (range->min_version) {
        auto min = AppVersion::Parse(*range->min_version);
        if (!min) {
            LogWarn("invalid minVersion '%s'", range->min_version->c_str());
            return false;
        }
        if (version < *min) return false;
    }

    if (range->max_version) {
        auto max = AppVersion::Parse(*range->max_version);
        if (!max) {
            LogWarn("invalid maxVersion '%s'", range->max_version->c_str());
            return false;
        }
        if (version >= *max) return false;
    }

    const std::string canonical = version.ToString();
    for (const auto& excluded : range->exclude_versions) {
        if (excluded == canonical) return false;
        auto parsed = AppVersion::Parse(excluded);
        if (parsed && parsed->ToString() == canonical) return false;
    }
    return true;
}

UpgradeManifest UpgradeResolver::MakeAppUpdateManifest(const UpdateFileRecord& latest) const {
    const std::string ver = latest.version->ToString();

    UpgradeManifest m;
    m.id = "app-update-" + ver;
    m.name = "Application Update " + ver;
    m.description = "Main application update";
    m.version = ver;
    m.type = "app";
    m.applies_to = VersionRange{.min_version = std::nullopt, .max_version = ver, .exclude_versions = {}};
    m.target_version = ver;
    m.priority = kAppUpdatePriority;
    m.kind = AppUpdate{.target_version = ver, .source_archive = latest.path};
    return m;
}

bool UpgradeResolver::BindArtifacts(UpgradeManifest& manifest, const UpdateFileRecord& latest) const {
    if (auto* app = std::get_if<AppUpdate>(&manifest.kind)) {
        if (app->target_version.empty()) app->target_version = latest.version->ToString();
        if (app->source_archive.empty()) app->source_archive = latest.path;
        return true;
    }

    if (auto* self = std::get_if<SelfUpdate>(&manifest.kind)) {
        if (!self->source_archive.empty()) return true;
        const auto updater = updater_.LatestUpdater();
        if (!updater || !updater->version) {
            LogWarn("upgrade %s: no updater release to ship, skipping", manifest.id.c_str());
            return false;
        }
        const std::string ver = updater->version->ToString();
        if (self->updater_version.empty()) self->updater_version = ver;
        if (self->staging_dir.empty()) {
            self->staging_dir = (std::filesystem::path(updater_.StagingDir()) / ("updater-" + ver)).string();
        }
        self->source_archive = updater->path;
    }
    return true;
}

Result UpgradeResolver::GetApplicableUpgrades(const std::string& app_name,
                                              const AppVersion& client_version,
                                              bool include_prerelease,
                                              const std::optional<std::string>& installer_version,
                                              ApplicableUpgradesResult& out) const {
    out = {};

    const auto folder = locator_.GetFolder(app_name);
    if (!folder) {
        LogWarn("app folder not found for %s", app_name.c_str());
        return Result::Fail(ErrorKind::NotFound, "Unknown app: " + app_name);
    }

    const auto latest = UpdateLocator::SelectTrack(UpdateLocator::GetLatestUpdateInfo(*folder), include_prerelease);
    if (!latest || !latest->version) {
        LogWarn("no latest version found for %s", app_name.c_str());
        return Result::Fail(ErrorKind::NotFound, "No versioned update for app: " + app_name);
    }
    const AppVersion& latest_version = *latest->version;

    std::vector<UpgradeManifest> applicable;
    for (auto& m : repository_.LoadAll(ManifestRepository::ManifestDirFor(*folder))) {
        if (!IsVersionInRange(client_version, m.applies_to)) continue;
        if (m.target_version) {
            auto target = AppVersion::Parse(*m.target_version);
            if (!target) {
                LogWarn("upgrade %s: invalid targetVersion '%s'", m.id.c_str(), m.target_version->c_str());
                continue;
            }
            if (*target > latest_version) continue;
        }
        if (!BindArtifacts(m, *latest)) continue;
        applicable.push_back(std::move(m));
    }

    std::vector<UpgradeManifest> ordered;
    auto r = OrderUpgrades(applicable, ordered);
    if (!r.is_ok()) return r;

    if (latest_version > client_version) {
        ordered.push_back(MakeAppUpdateManifest(*latest));
    }

    if (installer_version && !installer_version->empty()) {
        if (auto self = updater_.GenerateSelfUpdateManifest(*installer_version)) {
            LogInfo("injecting updater self-update manifest %s", self->id.c_str());
            ordered.push_back(std::move(*self));
        }
    }

    std::uint64_t total = 0;
    for (const auto& m : ordered) total += m.TotalFileSize();

    out.target_version = latest_version.ToString();
    out.upgrades = std::move(ordered);
    out.estimated_size = total;

    LogInfo("%s: %zu upgrade(s) from %s to %s",
            app_name.c_str(), out.upgrades.size(),
            client_version.ToString().c_str(), out.target_version.c_str());
    return Result::Ok();
}

} // namespace updsrv
