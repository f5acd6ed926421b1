#pragma once

#include "upgrade/updater_updates.hpp"
#include "util/cancel.hpp"
#include "util/result.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace updsrv {

inline constexpr const char kEmbeddedUpdaterName[] = "updater-new.tar.gz";

// Classifies clients that predate the manifest-driven protocol.
class LegacyClientDetector {
  public:
    // `AppUpdater/x.y.z` in the user agent wins, then the explicit version
    // header. A client without a usable version is legacy.
    static bool IsLegacy(std::string_view user_agent, std::string_view updater_version_header);

    static std::optional<AppVersion> VersionFromUserAgent(std::string_view user_agent);
};

// Repackages a plain app update so that legacy clients also install the
// current updater: the updater archive and a `run.sh` that unpacks it are
// added below `upgrade/` in the app archive.
class LegacyCompat {
  public:
    LegacyCompat(const UpdaterUpdates& updater,
                 std::map<std::string, std::string> device_folders,
                 std::string device_home,
                 CancelToken cancel = {});

    // On success `out_path` names a new temporary archive owned by the
    // caller, or is empty when the original asset should be served as is
    // (no self-update due, or the asset is not a tar.gz).
    Result PackageAppUpdateWithUpdater(const std::string& app_name,
                                       const std::string& app_update_path,
                                       std::string& out_path) const;

    // On-device folder of an app; lower-cased app name when unmapped.
    std::string DeviceFolderName(const std::string& app_name) const;

    std::string GenerateRunScript(const std::string& device_folder, bool with_bootstrap) const;

  private:
    const UpdaterUpdates& updater_;
    std::map<std::string, std::string> device_folders_;
    std::string device_home_;
    CancelToken cancel_;
};

} // namespace updsrv
