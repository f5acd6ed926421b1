#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace updsrv {

struct VersionRange {
    std::optional<std::string> min_version;   // inclusive
    std::optional<std::string> max_version;   // exclusive
    std::vector<std::string> exclude_versions;
};

struct UpgradeStorage {
    std::string type;
    std::string base_path;
    std::string path;
};

struct FileDirective {
    std::string path;
    std::optional<std::string> target;
    std::string permissions;
    bool required = false;
    bool executable = false;
    bool explode = false;
    bool backup = false;
    int run_order = 0;
    std::uint64_t size = 0;
    std::string checksum;
};

struct UpgradeChecksum {
    std::string algorithm;
    std::string value;
};

// Manifest kinds. Standard upgrades carry their payload in `storage`;
// the synthetic kinds name the artifact that is copied in at packaging time.
struct StandardUpgrade {};

struct AppUpdate {
    std::string target_version;
    std::string source_archive;   // resolved at lookup time, not serialized
};

struct SelfUpdate {
    std::string updater_version;
    std::string staging_dir;
    std::string source_archive;
};

using UpgradeKind = std::variant<StandardUpgrade, AppUpdate, SelfUpdate>;

inline constexpr const char kMetadataTypeKey[] = "Type";
inline constexpr const char kAppUpdateType[] = "AppUpdate";
inline constexpr const char kSelfUpdateType[] = "UpdaterSelfUpdate";

struct UpgradeManifest {
    std::string id;
    std::string name;
    std::string description;
    std::string version;
    std::string type;
    std::optional<VersionRange> applies_to;
    std::optional<std::string> target_version;
    int priority = 0;
    std::vector<std::string> dependencies;
    std::vector<std::string> conflicts;
    std::optional<UpgradeStorage> storage;
    std::vector<FileDirective> files;
    std::optional<std::string> pre_install_script;
    std::optional<std::string> post_install_script;
    std::optional<std::string> rollback_script;
    std::optional<UpgradeChecksum> checksum;
    // Free-form metadata, kept as serialized JSON values.
    std::map<std::string, std::string> metadata;

    UpgradeKind kind = StandardUpgrade{};

    bool IsStandard() const { return std::holds_alternative<StandardUpgrade>(kind); }
    std::uint64_t TotalFileSize() const;
};

struct PackageManifest {
    std::string from_version;
    std::string to_version;
    std::vector<std::string> upgrades;
};

struct ApplicableUpgradesResult {
    std::string target_version;
    std::vector<UpgradeManifest> upgrades;
    std::uint64_t estimated_size = 0;
};

} // namespace updsrv
