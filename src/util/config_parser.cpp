#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"

#include <filesystem>

namespace updsrv::config {

namespace {

bool FillConfigFromJson(const nlohmann::json& j, ServerConfigFromFile& cfg, std::string& err) {
    using namespace detail;
    return ReadNonEmptyString(j, "AppsRoot", cfg.apps_root, err) &&
           ReadNonEmptyString(j, "UpgradeRoot", cfg.upgrade_root, err) &&
           ReadNonEmptyString(j, "FallbackCacheRoot", cfg.fallback_cache_root, err) &&
           ReadNonEmptyString(j, "ScratchRoot", cfg.scratch_root, err) &&
           ReadNonEmptyString(j, "UpdaterApp", cfg.updater_app, err) &&
           ReadString(j, "InstallerStagingDir", cfg.installer_staging_dir, err) &&
           ReadString(j, "DeviceHome", cfg.device_home, err) &&
           ReadStringMap(j, "AppNames", cfg.app_names, err) &&
           ReadStringMap(j, "AppFolderMapping", cfg.app_folder_mapping, err) &&
           ReadLogLevel(j, "LogLevel", cfg.log_level, err);
}

} // namespace

void ServerConfigFromFile::Reset() {
    *this = ServerConfigFromFile{};
    std::error_code ec;
    std::filesystem::path tmp = std::filesystem::temp_directory_path(ec);
    if (ec) tmp = "/tmp";
    fallback_cache_root = (tmp / "updsrv-cache").string();
    scratch_root = tmp.string();
}

bool ServerConfigFromFile::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        LogError("Config: %s", err.c_str());
        return false;
    }

    if (!FillConfigFromJson(json, *this, err)) {
        LogError("Config: %s in %s", err.c_str(), path.c_str());
        return false;
    }

    LogDebug("Config: loaded %s (apps=%s upgrade=%s)", path.c_str(), apps_root.c_str(), upgrade_root.c_str());
    return true;
}

bool ServerConfigFromFile::LoadString(const std::string& json_text, std::string& err) {
    Reset();

    nlohmann::json json;
    if (!detail::ParseJsonObject(json_text, json, err))
        return false;
    return FillConfigFromJson(json, *this, err);
}

} // namespace updsrv::config
