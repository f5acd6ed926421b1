#include "upgrade/package_builder.hpp"

#include "archive/tar_codec.hpp"
#include "io/file_copy.hpp"
#include "io/file_writer.hpp"
#include "util/logger.hpp"
#include "util/manifest_parser.hpp"
#include "util/temp_fs.hpp"

#include <filesystem>
#include <mutex>
#include <sys/stat.h>

namespace updsrv {

namespace fs = std::filesystem;

namespace {

Result WriteTextFile(const fs::path& path, const std::string& text) {
    FileWriter w;
    auto r = FileWriter::Open(path.string(), w);
    if (!r.is_ok()) return r;
    r = WriteText(w, text);
    if (!r.is_ok()) return r;
    return w.Close();
}

std::optional<std::uint64_t> FileSize(const std::string& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) return std::nullopt;
    return static_cast<std::uint64_t>(st.st_size);
}

Result MakeDirs(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) return Result::Fail(ErrorKind::Io, "mkdir failed: " + dir.string() + " (" + ec.message() + ")");
    return Result::Ok();
}

} // namespace

PackageBuilder::PackageBuilder(const UpgradeResolver& resolver,
                               PackageCache& cache,
                               std::string upgrade_root,
                               std::string scratch_root,
                               CancelToken cancel)
    : resolver_(resolver),
      cache_(cache),
      upgrade_root_(std::move(upgrade_root)),
      scratch_root_(scratch_root.empty() ? TempRoot() : std::move(scratch_root)),
      cancel_(std::move(cancel)) {}

std::string PackageBuilder::SourcePathFor(const UpgradeManifest& manifest) const {
    fs::path base = upgrade_root_;
    std::string rel;
    if (manifest.storage) {
        if (!manifest.storage->base_path.empty()) base = manifest.storage->base_path;
        rel = manifest.storage->path;
    }
    return (base / rel).string();
}

Result PackageBuilder::StageOne(UpgradeManifest& upgrade, const std::string& dest_dir) const {
    struct Stager {
        const PackageBuilder& self;
        UpgradeManifest& m;
        const fs::path dest;

        Result operator()(const StandardUpgrade&) const {
            const std::string src = self.SourcePathFor(m);
            std::error_code ec;
            if (!fs::is_directory(src, ec)) {
                LogError("upgrade source path not found: %s", src.c_str());
                return Result::Fail(ErrorKind::SourceMissing, "Upgrade source path not found: " + src);
            }
            return CopyTree(src, dest.string(), self.cancel_);
        }

        Result operator()(const AppUpdate& k) const {
            if (k.source_archive.empty() || !fs::exists(k.source_archive)) {
                return Result::Fail(ErrorKind::SourceMissing, "App update file not found for " + m.id);
            }
            LogInfo("packaging app update from %s", k.source_archive.c_str());
            const std::string file_name = fs::path(k.source_archive).filename().string();
            std::uint64_t copied = 0;
            auto r = CopyFile(k.source_archive, (dest / file_name).string(), self.cancel_, &copied);
            if (!r.is_ok()) return r;

            FileDirective f;
            f.path = file_name;
            f.explode = true;
            f.size = copied;
            m.files = {f};
            return Result::Ok();
        }

        Result operator()(const SelfUpdate& k) const {
            if (k.source_archive.empty() || !fs::exists(k.source_archive)) {
                LogWarn("updater update file not found");
                return Result::Fail(ErrorKind::SourceMissing, "Updater update file not found");
            }
            LogInfo("packaging updater self-update from %s", k.source_archive.c_str());
            const std::string file_name = fs::path(k.source_archive).filename().string();
            const std::string dst = (dest / file_name).string();
            auto r = CopyFile(k.source_archive, dst, self.cancel_);
            if (!r.is_ok()) return r;

            const auto src_size = FileSize(k.source_archive);
            const auto dst_size = FileSize(dst);
            if (!src_size || !dst_size || *src_size != *dst_size) {
                return Result::Fail(ErrorKind::IntegrityMismatch,
                                    "Copied updater size mismatch: " + file_name);
            }

            FileDirective f;
            f.path = file_name;
            f.target = k.staging_dir;
            f.explode = true;
            f.size = *src_size;
            m.files = {f};
            return Result::Ok();
        }
    };

    auto r = std::visit(Stager{*this, upgrade, fs::path(dest_dir)}, upgrade.kind);
    if (!r.is_ok()) return r;

    return WriteTextFile(fs::path(dest_dir) / "manifest.json", ManifestParser::Serialize(upgrade));
}

Result PackageBuilder::Stage(std::vector<UpgradeManifest>& upgrades,
                             const PackageManifest& package,
                             const std::string& staging_root) const {
    const fs::path pkg_dir = fs::path(staging_root) / "upgrade";
    const fs::path upgrades_dir = pkg_dir / "upgrades";

    auto r = MakeDirs(upgrades_dir);
    if (!r.is_ok()) return r;

    r = WriteTextFile(pkg_dir / "package-manifest.json", ManifestParser::Serialize(package));
    if (!r.is_ok()) return r;

    for (auto& upgrade : upgrades) {
        if (cancel_.IsCancelled()) return Result::Fail(ErrorKind::Cancelled, "package build cancelled");

        const fs::path dest = upgrades_dir / upgrade.id;
        r = MakeDirs(dest);
        if (!r.is_ok()) return r;

        r = StageOne(upgrade, dest.string());
        if (!r.is_ok()) return r;
    }
    return Result::Ok();
}

Result PackageBuilder::BuildUpgradePackage(const std::string& app_name,
                                           const AppVersion& client_version,
                                           bool include_prerelease,
                                           const std::optional<std::string>& installer_version,
                                           std::string& out_path,
                                           bool* from_cache) const {
    if (from_cache) *from_cache = false;

    ApplicableUpgradesResult resolved;
    auto r = resolver_.GetApplicableUpgrades(app_name, client_version, include_prerelease,
                                             installer_version, resolved);
    if (!r.is_ok()) return r;
    if (resolved.upgrades.empty()) {
        return Result::Fail(ErrorKind::NotFound, app_name + " is up to date");
    }

    const auto app_folder = resolver_.Locator().GetFolder(app_name);
    if (!app_folder) return Result::Fail(ErrorKind::NotFound, "Unknown app: " + app_name);

    const std::string client = client_version.ToString();
    std::vector<std::string> ids;
    for (const auto& u : resolved.upgrades) ids.push_back(u.id);
    const std::string fingerprint = PackageCache::Fingerprint(client, ids);
    const std::string file_name = PackageCache::FileName(client, fingerprint);

    auto cached = [&]() -> std::optional<std::string> {
        std::vector<fs::path> candidates{fs::path(*app_folder) / "cache" / file_name};
        if (!cache_.FallbackRoot().empty()) {
            candidates.push_back(fs::path(cache_.FallbackRoot()) / app_name / file_name);
        }
        std::error_code ec;
        for (const auto& c : candidates) {
            if (fs::is_regular_file(c, ec)) return c.string();
        }
        return std::nullopt;
    };

    auto serve_cached = [&](const std::string& hit) {
        LogInfo("returning cached package: %s", hit.c_str());
        out_path = hit;
        if (from_cache) *from_cache = true;
        return Result::Ok();
    };

    if (auto hit = cached()) return serve_cached(*hit);

    auto lock = cache_.LockFor(fingerprint);
    std::lock_guard<std::mutex> guard(*lock);

    // Another request may have finished the same package meanwhile.
    if (auto hit = cached()) return serve_cached(*hit);

    std::string cache_dir;
    r = cache_.SelectDir(app_name, *app_folder, cache_dir);
    if (!r.is_ok()) return r;

    ScratchDir scratch;
    r = ScratchDir::Create(scratch_root_, "updsrv-stage-", scratch);
    if (!r.is_ok()) return r;

    PackageManifest package;
    package.from_version = client;
    package.to_version = resolved.target_version;
    package.upgrades = ids;

    r = Stage(resolved.upgrades, package, scratch.Path());
    if (!r.is_ok()) {
        LogError("staging %s failed: %s", app_name.c_str(), r.msg.c_str());
        return r;
    }

    TempFile tmp;
    r = TempFile::Create(cache_dir, file_name + ".tmp-", "", tmp);
    if (!r.is_ok()) return r;

    TarCodec codec(cancel_);
    r = codec.CreateTarGz(scratch.Path(), tmp.Path());
    if (!r.is_ok()) return r;

    const std::string final_path = (fs::path(cache_dir) / file_name).string();
    r = PackageCache::Publish(tmp.Path(), final_path);
    if (!r.is_ok()) return r;
    tmp.Release();

    LogInfo("built upgrade package %s (%zu upgrade(s))", final_path.c_str(), ids.size());
    out_path = final_path;
    return Result::Ok();
}

} // namespace updsrv
