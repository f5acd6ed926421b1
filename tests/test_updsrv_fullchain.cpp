#include "testing.hpp"

#include <archive_entry.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>
#include <sys/wait.h>

namespace updsrv {
namespace {

namespace fs = std::filesystem;
using json = nlohmann::json;

std::string ShellQuote(const std::string& s) {
    std::string out = "'";
    for (const char c : s) {
        if (c == '\'') {
            out += "'\"'\"'";
        } else {
            out.push_back(c);
        }
    }
    out.push_back('\'');
    return out;
}

int ExitCodeFromSystem(int rc) {
    if (rc == -1) {
        return -1;
    }
    if (WIFEXITED(rc)) {
        return WEXITSTATUS(rc);
    }
    return -1;
}

class MainCliTest : public ::testing::Test {
  protected:
    void SetUp() override {
        testutil::WriteBytes(tmp_.Sub("apps/demo-files/demo-1.0.0.tar.gz"),
                             testutil::BuildTar({{"demo", "v1", AE_IFREG}}, /*gzip=*/true));
        testutil::WriteBytes(tmp_.Sub("apps/demo-files/demo-1.1.0-beta.ab12cd3.tar.gz"),
                             testutil::BuildTar({{"demo", "v1.1", AE_IFREG}}, /*gzip=*/true));
        testutil::WriteFile(tmp_.Sub("upgrades/fonts/a.ttf"), "font");
        testutil::WriteFile(tmp_.Sub("apps/demo-files/upgrade-manifests/fonts.json"),
                            R"({"id":"fonts","name":"Fonts","priority":5,"storage":{"path":"fonts"},
                                "appliesTo":{"maxVersion":"1.0.0"}})");

        const json cfg = {{"AppsRoot", tmp_.Sub("apps")},
                          {"UpgradeRoot", tmp_.Sub("upgrades")},
                          {"FallbackCacheRoot", tmp_.Sub("fallback")},
                          {"AppNames", {{"Demo", "demo-files"}}},
                          {"LogLevel", "error"}};
        config_ = tmp_.Sub("updsrv.json");
        testutil::WriteFile(config_, cfg.dump());
    }

    // Runs the tool, capturing stdout.
    int Run(const std::string& args, std::string* out = nullptr) const {
        const std::string out_file = tmp_.Sub("stdout.txt");
        const std::string cmd = "UPDSRV_CONFIG=" + ShellQuote(config_) + " " + ShellQuote(UPDSRV_TOOL_BIN) +
                                " " + args + " >" + ShellQuote(out_file) + " 2>/dev/null";
        const int rc = ExitCodeFromSystem(std::system(cmd.c_str()));
        if (out) *out = testutil::ReadFile(out_file);
        return rc;
    }

    testutil::TemporaryDirectory tmp_;
    std::string config_;
};

TEST_F(MainCliTest, CheckReportsUpToDate) {
    std::string out;
    ASSERT_EQ(Run("-U 2.0.0 -V 1.0.0 check Demo", &out), 0);
    EXPECT_EQ(out, "true\n");

    ASSERT_EQ(Run("-U 2.0.0 -V 0.9.0 check Demo", &out), 0);
    EXPECT_EQ(out, "false\n");

    ASSERT_EQ(Run("-U 2.0.0 --prerelease -V 1.0.0 check Demo", &out), 0);
    EXPECT_EQ(out, "false\n");

    ASSERT_EQ(Run("-V 5.0.0 -u 'AppUpdater/1.2.0' check Demo", &out), 0);
    EXPECT_EQ(out, "false\n");
}

TEST_F(MainCliTest, ClientWithoutUpdaterMarkerIsLegacy) {
    std::string out;
    ASSERT_EQ(Run("-V 1.0.0 check Demo", &out), 0);
    EXPECT_EQ(out, "false\n");

    ASSERT_EQ(Run("-V 1.0.0 -u 'AppUpdater/2.3.0' check Demo", &out), 0);
    EXPECT_EQ(out, "true\n");
}

TEST_F(MainCliTest, ListPrintsUpgrades) {
    std::string out;
    ASSERT_EQ(Run("-V 0.9.0 list Demo", &out), 0);

    const auto doc = json::parse(out);
    EXPECT_EQ(doc["upToDate"], false);
    EXPECT_EQ(doc["currentVersion"], "0.9.0");
    EXPECT_EQ(doc["targetVersion"], "1.0.0");
    ASSERT_EQ(doc["upgrades"].size(), 2u);
    EXPECT_EQ(doc["upgrades"][0]["id"], "fonts");
    EXPECT_EQ(doc["upgrades"][1]["id"], "app-update-1.0.0");
    EXPECT_EQ(doc["requiresDownload"], true);

    ASSERT_EQ(Run("-V 1.0.0 list Demo", &out), 0);
    EXPECT_EQ(json::parse(out), (json{{"upToDate", true}}));
}

TEST_F(MainCliTest, FetchUpgradeWritesArchive) {
    const std::string dest = tmp_.Sub("package.tar.gz");
    std::string out;
    ASSERT_EQ(Run("-V 0.9.0 -o " + ShellQuote(dest) + " fetch-upgrade Demo", &out), 0);
    EXPECT_EQ(json::parse(out)["path"], dest);
    EXPECT_EQ(json::parse(out)["cached"], false);

    const auto entries = testutil::ReadArchive(dest);
    EXPECT_EQ(entries.at("upgrade/upgrades/fonts/a.ttf"), "font");
    EXPECT_TRUE(entries.count("upgrade/upgrades/app-update-1.0.0/demo-1.0.0.tar.gz"));
    EXPECT_TRUE(fs::exists(tmp_.Sub("apps/demo-files/cache")));

    ASSERT_EQ(Run("-V 0.9.0 fetch-upgrade Demo", &out), 0);
    EXPECT_EQ(json::parse(out)["cached"], true);
}

TEST_F(MainCliTest, FetchUpdatePrintsPath) {
    std::string out;
    ASSERT_EQ(Run("fetch-update Demo", &out), 0);
    const auto doc = json::parse(out);
    EXPECT_EQ(doc["path"], tmp_.Sub("apps/demo-files/demo-1.0.0.tar.gz"));
    EXPECT_EQ(doc["temporary"], false);
}

TEST_F(MainCliTest, LatestInfo) {
    std::string out;
    ASSERT_EQ(Run("-p latest-info Demo", &out), 0);
    const auto doc = json::parse(out);
    EXPECT_EQ(doc["stable"]["version"], "1.0.0");
    EXPECT_EQ(doc["stable"]["file"], "demo-1.0.0.tar.gz");
    EXPECT_EQ(doc["prerelease"]["version"], "1.1.0-beta.ab12cd3");
}

TEST_F(MainCliTest, ExitCodes) {
    EXPECT_EQ(Run("-V 1.0.0 check Ghost"), 3);
    EXPECT_EQ(Run("-V 1.0.0 fetch-upgrade Demo"), 3);
    EXPECT_EQ(Run("-V nope list Demo"), 2);
    EXPECT_EQ(Run("list Demo"), 2);
    EXPECT_EQ(Run("frobnicate Demo"), 2);
    EXPECT_EQ(Run("check"), 2);

    fs::remove(config_);
    EXPECT_EQ(Run("-V 1.0.0 check Demo"), 1);
}

} // namespace
} // namespace updsrv
