#pragma once

#include "upgrade/app_folder_map.hpp"
#include "upgrade/legacy_compat.hpp"
#include "upgrade/package_builder.hpp"
#include "upgrade/package_cache.hpp"
#include "upgrade/update_locator.hpp"
#include "upgrade/updater_updates.hpp"
#include "upgrade/upgrade_resolver.hpp"
#include "util/cancel.hpp"
#include "util/config_parser.hpp"
#include "util/result.hpp"

#include <memory>
#include <optional>
#include <string>

namespace updsrv {

struct PlainUpdate {
    std::string path;
    bool temporary = false;   // caller removes it after serving
};

// Operations offered to the request layer. Synchronous and safe to call
// from several threads at once.
class UpdateService {
  public:
    explicit UpdateService(const config::ServerConfigFromFile& cfg, CancelToken cancel = {});

    UpdateService(const UpdateService&) = delete;
    UpdateService& operator=(const UpdateService&) = delete;

    // Legacy clients are always told to update.
    Result CheckVersion(const std::string& app_name,
                        const CheckRequest& check,
                        bool include_prerelease,
                        bool legacy_client,
                        bool& up_to_date) const;

    Result ListApplicableUpgrades(const std::string& app_name,
                                  const std::string& client_version,
                                  bool include_prerelease,
                                  const std::optional<std::string>& installer_version,
                                  ApplicableUpgradesResult& out) const;

    Result FetchUpgradePackage(const std::string& app_name,
                               const std::string& client_version,
                               bool include_prerelease,
                               const std::optional<std::string>& installer_version,
                               std::string& out_path,
                               bool* from_cache = nullptr) const;

    // Newest update file; legacy clients get it bundled with the updater
    // when that applies. CorruptAsset for anything but .exe or .gz files.
    Result FetchPlainUpdate(const std::string& app_name,
                            bool include_prerelease,
                            bool legacy_client,
                            PlainUpdate& out) const;

    Result LatestInfo(const std::string& app_name, AppUpdateInfo& out) const;

  private:
    UpdateLocator locator_;
    UpdaterUpdates updater_;
    UpgradeResolver resolver_;
    mutable PackageCache cache_;
    PackageBuilder builder_;
    LegacyCompat legacy_;
};

} // namespace updsrv
