#pragma once

#include "util/logger.hpp"

#include <map>
#include <optional>
#include <string>

namespace updsrv::config {

inline constexpr const char kDefaultConfigPath[] = "/etc/updsrv/updsrv.json";

class ServerConfigFromFile {
public:
    std::string apps_root = "apps";
    std::string upgrade_root = "upgrade";
    std::string fallback_cache_root;
    std::string scratch_root;   // staging area for package builds
    std::string updater_app = "Updater";
    std::string installer_staging_dir = "/home/hemo/updater/pending-update";
    std::string device_home = "/home/hemo";

    std::map<std::string, std::string> app_names;
    std::map<std::string, std::string> app_folder_mapping;

    std::optional<LogLevel> log_level;

    bool LoadFile(const std::string& path);
    bool LoadString(const std::string& json_text, std::string& err);

    void Reset();
};

} // namespace updsrv::config
