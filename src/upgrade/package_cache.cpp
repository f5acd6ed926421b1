#include "upgrade/package_cache.hpp"

#include "crypto/digest.hpp"
#include "util/logger.hpp"
#include "util/temp_fs.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <sys/stat.h>

namespace updsrv {

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kFingerprintNameLen = 16;

} // namespace

PackageCache::PackageCache(std::string fallback_root) : fallback_root_(std::move(fallback_root)) {}

std::string PackageCache::Fingerprint(const std::string& client_version, std::vector<std::string> upgrade_ids) {
    std::sort(upgrade_ids.begin(), upgrade_ids.end());

    std::string key = client_version;
    key.push_back('|');
    for (std::size_t i = 0; i < upgrade_ids.size(); ++i) {
        if (i) key.push_back('\n');
        key += upgrade_ids[i];
    }
    return Sha256Hex(std::string_view(key));
}

std::string PackageCache::FileName(const std::string& client_version, const std::string& fingerprint) {
    return "upgrade-" + client_version + "-" + fingerprint.substr(0, kFingerprintNameLen) + ".tar.gz";
}

bool PackageCache::IsWritableDir(const std::string& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec || !fs::is_directory(dir, ec)) return false;

    TempFile probe;
    return TempFile::Create(dir, ".probe-", "", probe).is_ok();
}

Result PackageCache::SelectDir(const std::string& app_name,
                               const std::string& app_folder,
                               std::string& out_dir) const {
    const std::string preferred = (fs::path(app_folder) / "cache").string();
    if (IsWritableDir(preferred)) {
        out_dir = preferred;
        return Result::Ok();
    }

    if (!fallback_root_.empty()) {
        const std::string fallback = (fs::path(fallback_root_) / app_name).string();
        if (IsWritableDir(fallback)) {
            LogWarn("cache dir %s not writable, falling back to %s", preferred.c_str(), fallback.c_str());
            out_dir = fallback;
            return Result::Ok();
        }
    }

    LogError("no writable cache directory for %s", app_name.c_str());
    return Result::Fail(ErrorKind::PermissionDenied, "No writable cache directory for " + app_name);
}

std::shared_ptr<std::mutex> PackageCache::LockFor(const std::string& fingerprint) {
    std::lock_guard<std::mutex> guard(table_mu_);

    for (auto it = locks_.begin(); it != locks_.end();) {
        if (it->second.expired() && it->first != fingerprint) {
            it = locks_.erase(it);
        } else {
            ++it;
        }
    }

    auto& slot = locks_[fingerprint];
    if (auto existing = slot.lock()) return existing;

    auto created = std::make_shared<std::mutex>();
    slot = created;
    return created;
}

Result PackageCache::Publish(const std::string& temp_path, const std::string& final_path) {
    // mkstemp creates 0600; cached archives are served to other readers.
    if (::chmod(temp_path.c_str(), 0644) != 0) {
        const int err = errno;
        return Result::Fail(err, "chmod " + temp_path + " failed: " + std::strerror(err));
    }
    if (std::rename(temp_path.c_str(), final_path.c_str()) != 0) {
        const int err = errno;
        return Result::Fail(err, "rename " + temp_path + " -> " + final_path + " failed: " + std::strerror(err));
    }
    return Result::Ok();
}

} // namespace updsrv
