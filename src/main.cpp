#include "io/file_copy.hpp"
#include "system/signals.hpp"
#include "upgrade/legacy_compat.hpp"
#include "upgrade/update_service.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <getopt.h>
#include <iostream>
#include <optional>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

using json = nlohmann::json;

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;
constexpr int kExitNotFound = 3;

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [options] <command> <app>\n"
        "\n"
        "Commands:\n"
        "  check           Is the client up to date (prints true/false)\n"
        "  list            Upgrades applicable to --version\n"
        "  fetch-upgrade   Build (or reuse) the upgrade package for --version\n"
        "  fetch-update    Newest plain update file\n"
        "  latest-info     Newest stable and pre-release files\n"
        "\n"
        "Options:\n"
        "  -c, --config             Config file (default %s, env UPDSRV_CONFIG)\n"
        "  -V, --version            Client version\n"
        "  -m, --modified-since     Client file time, seconds since the epoch\n"
        "  -s, --checksum           MD5 of the client's copy\n"
        "  -i, --installer-version  Version of the client's updater\n"
        "  -p, --prerelease         Consider pre-release builds\n"
        "  -u, --user-agent         Client user agent (legacy detection)\n"
        "  -U, --updater-version    X-Updater-Version value (legacy detection)\n"
        "  -L, --legacy             Treat the client as legacy (also the default\n"
        "                           when neither -u nor -U names an updater version)\n"
        "  -o, --output             Copy the resulting archive here\n"
        "  -v, --verbose            Debug logging (else env UPDSRV_LOG_LEVEL, else config LogLevel)\n"
        "  -h, --help               Show this help\n",
        argv, updsrv::config::kDefaultConfigPath);
}

int ExitCodeFor(const updsrv::Result &r) {
    switch (r.kind) {
        case updsrv::ErrorKind::None: return kExitOk;
        case updsrv::ErrorKind::NotFound: return kExitNotFound;
        case updsrv::ErrorKind::InvalidInput: return kExitUsage;
        default: return kExitFailure;
    }
}

int Fail(const updsrv::Result &r) {
    std::fprintf(stderr, "ERROR: %s (%s)\n", r.msg.c_str(), updsrv::ToString(r.kind));
    return ExitCodeFor(r);
}

json RecordJson(const std::optional<updsrv::UpdateFileRecord> &rec) {
    if (!rec) return nullptr;
    return {{"version", rec->version ? json(rec->version->ToString()) : json()},
            {"file", std::filesystem::path(rec->path).filename().string()},
            {"lastModified", static_cast<long long>(rec->modified)}};
}

// Copies `path` to `dest` when given, otherwise prints where it is.
int Deliver(const std::string &path, const char *dest, bool temporary,
            std::optional<bool> cached = std::nullopt) {
    json doc = {{"path", path}, {"temporary", temporary}};
    if (cached) doc["cached"] = *cached;
    if (!dest) {
        std::cout << doc.dump() << std::endl;
        return kExitOk;
    }
    auto r = updsrv::CopyFile(path, dest, updsrv::ProcessCancelToken());
    if (temporary) ::unlink(path.c_str());
    if (!r.is_ok()) return Fail(r);
    doc["path"] = dest;
    doc["temporary"] = false;
    std::cout << doc.dump() << std::endl;
    return kExitOk;
}

} // namespace

int main(int argc, char **argv) {
    updsrv::InstallSignalHandlers();

    std::string config_path = updsrv::config::kDefaultConfigPath;
    if (const char *env = std::getenv("UPDSRV_CONFIG"); env && *env) config_path = env;

    std::optional<std::string> client_version;
    std::optional<std::time_t> modified_since;
    std::optional<std::string> checksum;
    std::optional<std::string> installer_version;
    std::string user_agent;
    std::string updater_header;
    bool include_prerelease = false;
    bool force_legacy = false;
    bool verbose = false;
    const char *out = nullptr;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"version", required_argument, nullptr, 'V'},
        {"modified-since", required_argument, nullptr, 'm'},
        {"checksum", required_argument, nullptr, 's'},
        {"installer-version", required_argument, nullptr, 'i'},
        {"prerelease", no_argument, nullptr, 'p'},
        {"user-agent", required_argument, nullptr, 'u'},
        {"updater-version", required_argument, nullptr, 'U'},
        {"legacy", no_argument, nullptr, 'L'},
        {"output", required_argument, nullptr, 'o'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hc:V:m:s:i:pu:U:Lo:v", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return kExitOk;

            case 'c':
                config_path = optarg;
                break;

            case 'V':
                client_version = optarg;
                break;

            case 'm': {
                char *end = nullptr;
                long long v = std::strtoll(optarg, &end, 10);
                if (!end || *end != '\0' || v < 0) {
                    std::fprintf(stderr, "Invalid --modified-since: %s\n", optarg);
                    return kExitUsage;
                }
                modified_since = static_cast<std::time_t>(v);
                break;
            }

            case 's':
                checksum = optarg;
                break;

            case 'i':
                installer_version = optarg;
                break;

            case 'p':
                include_prerelease = true;
                break;

            case 'u':
                user_agent = optarg;
                break;

            case 'U':
                updater_header = optarg;
                break;

            case 'L':
                force_legacy = true;
                break;

            case 'o':
                out = optarg;
                break;

            case 'v':
                verbose = true;
                break;

            default:
                PrintUsage(argv[0]);
                return kExitUsage;
        }
    }

    if (argc - optind != 2) {
        PrintUsage(argv[0]);
        return kExitUsage;
    }
    const std::string command = argv[optind];
    const std::string app = argv[optind + 1];

    updsrv::config::ServerConfigFromFile cfg;
    if (!cfg.LoadFile(config_path)) {
        std::fprintf(stderr, "ERROR: cannot load config: %s\n", config_path.c_str());
        return kExitFailure;
    }
    // -v beats UPDSRV_LOG_LEVEL, which beats the config file.
    const char *env_level = std::getenv(updsrv::kLogLevelEnv);
    if (verbose) {
        updsrv::Logger::Instance().SetLevel(updsrv::LogLevel::Debug);
    } else if (cfg.log_level && !(env_level && updsrv::ParseLogLevel(env_level))) {
        updsrv::Logger::Instance().SetLevel(*cfg.log_level);
    }

    // No updater version in either place means a pre-protocol client.
    const bool legacy = force_legacy || updsrv::LegacyClientDetector::IsLegacy(user_agent, updater_header);

    updsrv::UpdateService service(cfg, updsrv::ProcessCancelToken());

    if (command == "check") {
        updsrv::CheckRequest check;
        if (client_version) {
            auto v = updsrv::AppVersion::Parse(*client_version);
            if (!v) {
                std::fprintf(stderr, "Invalid --version: %s\n", v.error().c_str());
                return kExitUsage;
            }
            check.version = *v;
        }
        check.modified_since = modified_since;
        check.checksum = checksum;

        bool up_to_date = false;
        auto r = service.CheckVersion(app, check, include_prerelease, legacy, up_to_date);
        if (!r.is_ok()) return Fail(r);
        std::cout << (up_to_date ? "true" : "false") << std::endl;
        return kExitOk;
    }

    if (command == "list") {
        updsrv::ApplicableUpgradesResult result;
        auto r = service.ListApplicableUpgrades(app, client_version.value_or(""), include_prerelease,
                                                installer_version, result);
        if (!r.is_ok()) return Fail(r);

        if (result.upgrades.empty()) {
            std::cout << json{{"upToDate", true}}.dump() << std::endl;
            return kExitOk;
        }

        json upgrades = json::array();
        for (const auto &u : result.upgrades) {
            upgrades.push_back({{"id", u.id}, {"name", u.name}, {"priority", u.priority}});
        }
        json doc = {{"upToDate", false},
                    {"currentVersion", *client_version},
                    {"targetVersion", result.target_version},
                    {"upgrades", upgrades},
                    {"packageSize", result.estimated_size},
                    {"requiresDownload", true}};
        std::cout << doc.dump(2) << std::endl;
        return kExitOk;
    }

    if (command == "fetch-upgrade") {
        std::string path;
        bool cached = false;
        auto r = service.FetchUpgradePackage(app, client_version.value_or(""), include_prerelease,
                                             installer_version, path, &cached);
        if (!r.is_ok()) return Fail(r);
        return Deliver(path, out, false, cached);
    }

    if (command == "fetch-update") {
        updsrv::PlainUpdate update;
        auto r = service.FetchPlainUpdate(app, include_prerelease, legacy, update);
        if (!r.is_ok()) return Fail(r);
        return Deliver(update.path, out, update.temporary);
    }

    if (command == "latest-info") {
        updsrv::AppUpdateInfo info;
        auto r = service.LatestInfo(app, info);
        if (!r.is_ok()) return Fail(r);
        json doc = {{"stable", RecordJson(info.latest_stable)},
                    {"prerelease", include_prerelease ? RecordJson(info.latest_prerelease) : json()}};
        std::cout << doc.dump(2) << std::endl;
        return kExitOk;
    }

    std::fprintf(stderr, "Unknown command: %s\n", command.c_str());
    PrintUsage(argv[0]);
    return kExitUsage;
}
