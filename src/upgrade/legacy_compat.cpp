#include "upgrade/legacy_compat.hpp"

#include "archive/tar_codec.hpp"
#include "io/file_copy.hpp"
#include "io/file_writer.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"
#include "util/temp_fs.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace updsrv {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kUserAgentMarker = "AppUpdater/";

bool IsTarGz(const std::string& path) {
    std::string lower = fs::path(path).filename().string();
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return EndsWith(lower, ".tar.gz") || EndsWith(lower, ".tgz");
}

bool IsLegacyVersion(const AppVersion& v) { return v < kMinProtocolUpdaterVersion; }

} // namespace

std::optional<AppVersion> LegacyClientDetector::VersionFromUserAgent(std::string_view user_agent) {
    for (auto pos = user_agent.find(kUserAgentMarker); pos != std::string_view::npos;
         pos = user_agent.find(kUserAgentMarker, pos + 1)) {
        const auto start = pos + kUserAgentMarker.size();
        auto end = start;
        while (end < user_agent.size() &&
               (std::isdigit(static_cast<unsigned char>(user_agent[end])) || user_agent[end] == '.')) {
            ++end;
        }
        const auto token = user_agent.substr(start, end - start);
        if (std::count(token.begin(), token.end(), '.') < 2) continue;

        // Only the leading major.minor.patch counts.
        std::size_t dots = 0;
        std::size_t len = 0;
        for (; len < token.size(); ++len) {
            if (token[len] == '.' && ++dots == 3) break;
        }
        auto parsed = AppVersion::Parse(token.substr(0, len));
        if (parsed) return *parsed;
    }
    return std::nullopt;
}

bool LegacyClientDetector::IsLegacy(std::string_view user_agent, std::string_view updater_version_header) {
    if (auto v = VersionFromUserAgent(user_agent)) {
        LogDebug("updater %s from user agent", v->ToString().c_str());
        return IsLegacyVersion(*v);
    }

    if (!updater_version_header.empty()) {
        if (auto v = AppVersion::Parse(updater_version_header)) {
            LogDebug("updater %s from version header", v->ToString().c_str());
            return IsLegacyVersion(*v);
        }
    }

    LogDebug("no updater version detected, assuming legacy client");
    return true;
}

LegacyCompat::LegacyCompat(const UpdaterUpdates& updater,
                           std::map<std::string, std::string> device_folders,
                           std::string device_home,
                           CancelToken cancel)
    : updater_(updater),
      device_folders_(std::move(device_folders)),
      device_home_(std::move(device_home)),
      cancel_(std::move(cancel)) {}

std::string LegacyCompat::DeviceFolderName(const std::string& app_name) const {
    if (auto it = device_folders_.find(app_name); it != device_folders_.end()) {
        return it->second;
    }
    std::string lower = app_name;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    LogWarn("no device folder mapped for '%s', using '%s'", app_name.c_str(), lower.c_str());
    return lower;
}

std::string LegacyCompat::GenerateRunScript(const std::string& device_folder, bool with_bootstrap) const {
    std::string s;
    s += "#!/bin/bash\n";
    s += "\n";
    s += "# Installs the updater shipped in upgrade/" + std::string(kEmbeddedUpdaterName) + ".\n";
    s += "# Generated by updsrv.\n";
    s += "\n";
    s += "APP_FOLDER=\"" + device_folder + "\"\n";
    s += "UPGRADE_DIR=\"" + device_home_ + "/$APP_FOLDER/upgrade\"\n";
    s += "UPDATER_PATH=\"$UPGRADE_DIR/" + std::string(kEmbeddedUpdaterName) + "\"\n";
    s += "DESTINATION_DIR=\"" + device_home_ + "/updater\"\n";
    s += "\n";
    s += "if [ ! -f \"$UPDATER_PATH\" ]; then\n";
    s += "    echo \"[Upgrade] ERROR: Updater archive not found: $UPDATER_PATH\"\n";
    s += "    exit 1\n";
    s += "fi\n";
    s += "\n";
    s += "mkdir -p \"$DESTINATION_DIR\"\n";
    s += "\n";
    s += "echo \"[Upgrade] Extracting updater archive...\"\n";
    s += "if ! tar -xvzf \"$UPDATER_PATH\" -C \"$DESTINATION_DIR\"; then\n";
    s += "    echo \"[Upgrade] ERROR: Extraction failed.\"\n";
    s += "    exit 1\n";
    s += "fi\n";
    s += "echo \"[Upgrade] Extraction for updater completed successfully.\"\n";
    s += "echo \"[Upgrade] Files are located in $DESTINATION_DIR\"\n";
    if (with_bootstrap) {
        s += "\n";
        s += "for step in \"$UPGRADE_DIR\"/bootstrap/*.sh; do\n";
        s += "    [ -f \"$step\" ] || continue\n";
        s += "    echo \"[Upgrade] Running bootstrap step $(basename \"$step\")\"\n";
        s += "    if ! bash \"$step\"; then\n";
        s += "        echo \"[Upgrade] ERROR: Bootstrap step failed: $step\"\n";
        s += "        exit 1\n";
        s += "    fi\n";
        s += "done\n";
    }
    return s;
}

Result LegacyCompat::PackageAppUpdateWithUpdater(const std::string& app_name,
                                                 const std::string& app_update_path,
                                                 std::string& out_path) const {
    out_path.clear();

    if (!IsTarGz(app_update_path)) {
        LogInfo("%s is not a tar.gz, serving it without the updater", app_update_path.c_str());
        return Result::Ok();
    }
    if (!updater_.IsUpdaterUpdateNeeded()) {
        LogInfo("no updater update needed, serving app update as is");
        return Result::Ok();
    }

    const auto latest = updater_.LatestUpdater();
    if (!latest) {
        LogWarn("latest updater file not found");
        return Result::Ok();
    }

    ScratchDir scratch;
    auto r = ScratchDir::Create(TempRoot(), "updsrv-legacy-", scratch);
    if (!r.is_ok()) return r;

    const fs::path app_dir = fs::path(scratch.Path()) / "app";
    TarCodec codec(cancel_);
    r = codec.ExtractTarGz(app_update_path, app_dir.string());
    if (!r.is_ok()) return r;

    const fs::path upgrade_dir = app_dir / "upgrade";
    std::error_code ec;
    fs::create_directories(upgrade_dir, ec);
    if (ec) return Result::Fail(ErrorKind::Io, "mkdir failed: " + upgrade_dir.string());

    r = CopyFile(latest->path, (upgrade_dir / kEmbeddedUpdaterName).string(), cancel_);
    if (!r.is_ok()) return r;
    LogInfo("embedded %s as upgrade/%s", fs::path(latest->path).filename().c_str(), kEmbeddedUpdaterName);

    bool with_bootstrap = false;
    if (const auto folder = updater_.UpdaterFolder()) {
        const fs::path bootstrap = fs::path(*folder) / "bootstrap";
        if (fs::is_directory(bootstrap, ec)) {
            r = CopyTree(bootstrap.string(), (upgrade_dir / "bootstrap").string(), cancel_);
            if (!r.is_ok()) return r;
            with_bootstrap = true;
            LogInfo("bundled bootstrap scripts from %s", bootstrap.c_str());
        }
    }

    const std::string script = GenerateRunScript(DeviceFolderName(app_name), with_bootstrap);
    FileWriter w;
    r = FileWriter::Open((upgrade_dir / "run.sh").string(), w, 0755);
    if (!r.is_ok()) return r;
    r = WriteText(w, script);
    if (!r.is_ok()) return r;
    r = w.Close();
    if (!r.is_ok()) return r;

    TempFile out;
    r = TempFile::Create(TempRoot(), "app-with-updater-", ".tar.gz", out);
    if (!r.is_ok()) return r;

    r = codec.CreateTarGz(app_dir.string(), out.Path());
    if (!r.is_ok()) return r;

    out_path = out.Release();
    LogInfo("packaged %s with updater update: %s", app_name.c_str(), out_path.c_str());
    return Result::Ok();
}

} // namespace updsrv
