#pragma once

#include "upgrade/app_folder_map.hpp"
#include "util/version.hpp"

#include <ctime>
#include <memory>
#include <optional>
#include <string>

namespace updsrv {

struct UpdateFileRecord {
    std::string path;
    std::optional<AppVersion> version;   // nullopt: unversioned, always latest
    std::time_t modified = 0;
};

struct AppUpdateInfo {
    std::optional<UpdateFileRecord> latest_stable;
    std::optional<UpdateFileRecord> latest_prerelease;
};

struct CheckRequest {
    std::optional<AppVersion> version;
    std::optional<std::time_t> modified_since;
    std::optional<std::string> checksum;   // MD5 hex of the client's copy
};

class UpdateLocator {
  public:
    UpdateLocator(std::string apps_root, std::shared_ptr<const IAppFolderMap> folder_map);

    // Mapped folder, else a same-named subdirectory of the apps root.
    std::optional<std::string> GetFolder(const std::string& app_name) const;

    std::optional<std::string> GetUpdateFileForApp(const std::string& app_name,
                                                   bool include_prerelease) const;

    static std::optional<UpdateFileRecord> ScanLatest(const std::string& folder,
                                                      bool include_prerelease);
    static AppUpdateInfo GetLatestUpdateInfo(const std::string& folder);

    // Pre-release track only when requested and strictly newer than stable.
    static std::optional<UpdateFileRecord> SelectTrack(const AppUpdateInfo& info,
                                                       bool include_prerelease);

    static bool CheckVersion(const std::string& folder,
                             const CheckRequest& check,
                             bool include_prerelease);

    // Version from `<name>-<version>.<tar.gz|exe>`; nullopt when there is none.
    static std::optional<AppVersion> VersionFromFileName(const std::string& file_name);

    const std::string& AppsRoot() const { return apps_root_; }

  private:
    std::string apps_root_;
    std::shared_ptr<const IAppFolderMap> folder_map_;
};

} // namespace updsrv
