#include "upgrade/update_service.hpp"

#include "util/logger.hpp"

#include <filesystem>

namespace updsrv {

namespace fs = std::filesystem;

namespace {

Result ParseClientVersion(const std::string& text, AppVersion& out) {
    if (text.empty()) return Result::Fail(ErrorKind::InvalidInput, "Version is required");
    auto parsed = AppVersion::Parse(text);
    if (!parsed) return Result::Fail(ErrorKind::InvalidInput, "Invalid version format: " + parsed.error());
    out = *parsed;
    return Result::Ok();
}

} // namespace

UpdateService::UpdateService(const config::ServerConfigFromFile& cfg, CancelToken cancel)
    : locator_(cfg.apps_root, std::make_shared<ConfigAppFolderMap>(cfg.app_names)),
      updater_(locator_, cfg.updater_app, cfg.installer_staging_dir),
      resolver_(locator_, updater_),
      cache_(cfg.fallback_cache_root),
      builder_(resolver_, cache_, cfg.upgrade_root, cfg.scratch_root, cancel),
      legacy_(updater_, cfg.app_folder_mapping, cfg.device_home, cancel) {}

Result UpdateService::CheckVersion(const std::string& app_name,
                                   const CheckRequest& check,
                                   bool include_prerelease,
                                   bool legacy_client,
                                   bool& up_to_date) const {
    const auto folder = locator_.GetFolder(app_name);
    if (!folder) {
        LogInfo("check for unknown app: %s", app_name.c_str());
        return Result::Fail(ErrorKind::NotFound, "Unknown app: " + app_name);
    }

    up_to_date = legacy_client ? false : UpdateLocator::CheckVersion(*folder, check, include_prerelease);
    LogInfo("%s checking, client %s, legacy %s: up to date %s",
            app_name.c_str(),
            check.version ? check.version->ToString().c_str() : "unknown",
            legacy_client ? "yes" : "no",
            up_to_date ? "yes" : "no");
    return Result::Ok();
}

Result UpdateService::ListApplicableUpgrades(const std::string& app_name,
                                             const std::string& client_version,
                                             bool include_prerelease,
                                             const std::optional<std::string>& installer_version,
                                             ApplicableUpgradesResult& out) const {
    AppVersion client;
    auto r = ParseClientVersion(client_version, client);
    if (!r.is_ok()) return r;
    return resolver_.GetApplicableUpgrades(app_name, client, include_prerelease, installer_version, out);
}

Result UpdateService::FetchUpgradePackage(const std::string& app_name,
                                          const std::string& client_version,
                                          bool include_prerelease,
                                          const std::optional<std::string>& installer_version,
                                          std::string& out_path,
                                          bool* from_cache) const {
    AppVersion client;
    auto r = ParseClientVersion(client_version, client);
    if (!r.is_ok()) return r;

    r = builder_.BuildUpgradePackage(app_name, client, include_prerelease, installer_version, out_path,
                                     from_cache);
    if (!r.is_ok() && r.kind != ErrorKind::NotFound) {
        LogError("failed to build upgrade package for %s: %s", app_name.c_str(), r.msg.c_str());
    }
    return r;
}

Result UpdateService::FetchPlainUpdate(const std::string& app_name,
                                       bool include_prerelease,
                                       bool legacy_client,
                                       PlainUpdate& out) const {
    out = {};

    const auto file = locator_.GetUpdateFileForApp(app_name, include_prerelease);
    if (!file) {
        LogError("no update file found for app: %s", app_name.c_str());
        return Result::Fail(ErrorKind::NotFound, "No update file for app: " + app_name);
    }

    const std::string ext = fs::path(*file).extension().string();
    if (ext != ".exe" && ext != ".gz") {
        LogError("file is neither an executable nor a tarball: %s", file->c_str());
        return Result::Fail(ErrorKind::CorruptAsset, "Unexpected update file type: " + *file);
    }

    if (legacy_client) {
        std::string bundled;
        auto r = legacy_.PackageAppUpdateWithUpdater(app_name, *file, bundled);
        if (!r.is_ok()) {
            LogWarn("failed to package with updater (%s), serving normal update", r.msg.c_str());
        } else if (!bundled.empty()) {
            out.path = bundled;
            out.temporary = true;
            return Result::Ok();
        }
    }

    out.path = *file;
    return Result::Ok();
}

Result UpdateService::LatestInfo(const std::string& app_name, AppUpdateInfo& out) const {
    const auto folder = locator_.GetFolder(app_name);
    if (!folder) {
        LogInfo("latest info for unknown app: %s", app_name.c_str());
        return Result::Fail(ErrorKind::NotFound, "Unknown app: " + app_name);
    }
    out = UpdateLocator::GetLatestUpdateInfo(*folder);
    return Result::Ok();
}

} // namespace updsrv
