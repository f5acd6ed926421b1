#include "upgrade/update_locator.hpp"

#include "crypto/digest.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sys/stat.h>
#include <vector>

namespace updsrv {

namespace fs = std::filesystem;

namespace {

constexpr const char* kUpdateExtensions[] = {".tar.gz", ".exe"};

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

std::time_t ModifiedTime(const fs::path& p) {
    struct stat st{};
    if (::stat(p.c_str(), &st) != 0) return 0;
    return st.st_mtime;
}

// Strict-weak "ranks before" ordering: unversioned files first (newest first),
// then version descending, then modification time descending, then name.
bool RanksBefore(const UpdateFileRecord& a, const UpdateFileRecord& b) {
    if (a.version.has_value() != b.version.has_value()) return !a.version.has_value();
    if (a.version && b.version) {
        const int c = AppVersion::CompareWithTime(*a.version, a.modified, *b.version, b.modified);
        if (c != 0) return c > 0;
    } else if (a.modified != b.modified) {
        return a.modified > b.modified;
    }
    return a.path > b.path;
}

} // namespace

UpdateLocator::UpdateLocator(std::string apps_root, std::shared_ptr<const IAppFolderMap> folder_map)
    : apps_root_(std::move(apps_root)),
      folder_map_(folder_map ? std::move(folder_map) : std::make_shared<ConfigAppFolderMap>()) {}

std::optional<std::string> UpdateLocator::GetFolder(const std::string& app_name) const {
    if (app_name.empty()) return std::nullopt;

    if (auto mapped = folder_map_->Lookup(app_name)) {
        return (fs::path(apps_root_) / *mapped).string();
    }

    // Reject names that could climb out of the apps root.
    if (app_name.find('/') != std::string::npos || app_name == "." || app_name == "..") {
        return std::nullopt;
    }

    const fs::path candidate = fs::path(apps_root_) / app_name;
    std::error_code ec;
    if (fs::is_directory(candidate, ec)) return candidate.string();

    return std::nullopt;
}

std::optional<AppVersion> UpdateLocator::VersionFromFileName(const std::string& file_name) {
    const std::string lower = ToLower(file_name);
    std::string stem;
    for (const char* ext : kUpdateExtensions) {
        if (EndsWith(lower, ext)) {
            stem = file_name.substr(0, file_name.size() - std::char_traits<char>::length(ext));
            break;
        }
    }
    if (stem.empty()) return std::nullopt;

    // The name part may itself contain dashes: try every split point from the left.
    for (auto dash = stem.find('-'); dash != std::string::npos; dash = stem.find('-', dash + 1)) {
        if (dash == 0) continue;
        auto parsed = AppVersion::Parse(std::string_view(stem).substr(dash + 1));
        if (parsed) return *parsed;
    }
    return std::nullopt;
}

std::optional<UpdateFileRecord> UpdateLocator::ScanLatest(const std::string& folder,
                                                          bool include_prerelease) {
    std::error_code ec;
    fs::directory_iterator it(folder, ec);
    if (ec) {
        LogDebug("cannot list %s: %s", folder.c_str(), ec.message().c_str());
        return std::nullopt;
    }

    std::vector<UpdateFileRecord> candidates;
    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;
        if (!it->is_regular_file(ec)) continue;

        const std::string name = it->path().filename().string();
        if (name.empty() || name.front() == '.') continue;

        UpdateFileRecord rec;
        rec.path = it->path().string();
        rec.version = VersionFromFileName(name);
        rec.modified = ModifiedTime(it->path());
        if (!include_prerelease && rec.version && rec.version->IsPrerelease()) continue;
        candidates.push_back(std::move(rec));
    }

    if (candidates.empty()) return std::nullopt;
    return *std::min_element(candidates.begin(), candidates.end(), RanksBefore);
}

AppUpdateInfo UpdateLocator::GetLatestUpdateInfo(const std::string& folder) {
    AppUpdateInfo info;
    info.latest_stable = ScanLatest(folder, /*include_prerelease=*/false);
    info.latest_prerelease = ScanLatest(folder, /*include_prerelease=*/true);
    return info;
}

std::optional<UpdateFileRecord> UpdateLocator::SelectTrack(const AppUpdateInfo& info,
                                                           bool include_prerelease) {
    if (!include_prerelease || !info.latest_prerelease) return info.latest_stable;
    if (!info.latest_stable) return info.latest_prerelease;

    const auto& stable = *info.latest_stable;
    const auto& pre = *info.latest_prerelease;
    if (!stable.version) return stable;
    if (!pre.version) return pre;
    return AppVersion::Compare(*pre.version, *stable.version) > 0 ? pre : stable;
}

std::optional<std::string> UpdateLocator::GetUpdateFileForApp(const std::string& app_name,
                                                              bool include_prerelease) const {
    const auto folder = GetFolder(app_name);
    if (!folder) return std::nullopt;

    const auto selected = SelectTrack(GetLatestUpdateInfo(*folder), include_prerelease);
    if (!selected) return std::nullopt;
    return selected->path;
}

bool UpdateLocator::CheckVersion(const std::string& folder,
                                 const CheckRequest& check,
                                 bool include_prerelease) {
    const auto latest = SelectTrack(GetLatestUpdateInfo(folder), include_prerelease);
    if (!latest) {
        LogDebug("no update file in %s, reporting up to date", folder.c_str());
        return true;
    }

    if (!check.version && !check.modified_since) return false;

    bool up_to_date = true;
    if (check.version && latest->version && AppVersion::Compare(*latest->version, *check.version) > 0) {
        up_to_date = false;
    }
    if (up_to_date && check.modified_since && latest->modified > *check.modified_since) {
        up_to_date = false;
    }

    if (check.checksum && !check.checksum->empty()) {
        std::string md5;
        auto r = DigestHexFile(DigestAlgorithm::Md5, latest->path, md5);
        if (!r.is_ok()) {
            LogWarn("checksum of %s failed: %s", latest->path.c_str(), r.msg.c_str());
            return false;
        }
        return ToLower(md5) == ToLower(*check.checksum);
    }

    return up_to_date;
}

} // namespace updsrv
