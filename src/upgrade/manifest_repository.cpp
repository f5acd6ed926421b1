#include "upgrade/manifest_repository.hpp"

#include "io/file_reader.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <filesystem>

namespace updsrv {

namespace fs = std::filesystem;

std::string ManifestRepository::ManifestDirFor(const std::string& app_folder) {
    return (fs::path(app_folder) / kManifestDirName).string();
}

std::vector<UpgradeManifest> ManifestRepository::LoadAll(const std::string& manifests_dir) const {
    std::vector<UpgradeManifest> out;

    std::error_code ec;
    if (!fs::is_directory(manifests_dir, ec)) {
        LogDebug("no manifest directory at %s", manifests_dir.c_str());
        return out;
    }

    std::vector<fs::path> files;
    fs::directory_iterator it(manifests_dir, ec);
    for (const fs::directory_iterator end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        if (!EndsWith(it->path().filename().string(), ".json")) continue;
        files.push_back(it->path());
    }
    if (ec) {
        LogError("listing %s failed: %s", manifests_dir.c_str(), ec.message().c_str());
    }
    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        std::string text;
        auto r = FileReader::ReadText(file.string(), text);
        if (!r.is_ok()) {
            LogError("cannot read manifest %s: %s", file.c_str(), r.msg.c_str());
            continue;
        }

        auto parsed = parser_.Parse(text);
        if (!parsed) {
            LogError("failed to parse manifest %s: %s", file.c_str(), parsed.error().c_str());
            continue;
        }
        out.push_back(std::move(*parsed));
    }

    LogDebug("loaded %zu manifest(s) from %s", out.size(), manifests_dir.c_str());
    return out;
}

} // namespace updsrv
