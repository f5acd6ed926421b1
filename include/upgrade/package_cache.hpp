#pragma once

#include "util/result.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace updsrv {

// Content-addressed store of built upgrade archives.
//
// A package is keyed by the client version and the set of upgrade ids it
// contains. At most one build runs per key at a time, and archives appear in
// the cache only once complete.
class PackageCache {
  public:
    explicit PackageCache(std::string fallback_root);

    PackageCache(const PackageCache&) = delete;
    PackageCache& operator=(const PackageCache&) = delete;

    // SHA-256 hex of "<client>|<ids sorted, joined by '\n'>".
    static std::string Fingerprint(const std::string& client_version, std::vector<std::string> upgrade_ids);

    // upgrade-<client>-<first 16 hex digits>.tar.gz
    static std::string FileName(const std::string& client_version, const std::string& fingerprint);

    // `<app_folder>/cache` when writable, else `<fallback_root>/<app_name>`.
    // PermissionDenied when neither can be written.
    Result SelectDir(const std::string& app_name, const std::string& app_folder, std::string& out_dir) const;

    // Mutex serializing builds of one fingerprint. Entries live as long as a
    // caller holds them.
    std::shared_ptr<std::mutex> LockFor(const std::string& fingerprint);

    // Atomically moves a finished archive into place.
    static Result Publish(const std::string& temp_path, const std::string& final_path);

    static bool IsWritableDir(const std::string& dir);

    const std::string& FallbackRoot() const { return fallback_root_; }

  private:
    std::string fallback_root_;

    std::mutex table_mu_;
    std::map<std::string, std::weak_ptr<std::mutex>> locks_;
};

} // namespace updsrv
