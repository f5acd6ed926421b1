#include "crypto/digest.hpp"
#include "testing.hpp"
#include "upgrade/update_locator.hpp"

#include <cctype>
#include <filesystem>
#include <gtest/gtest.h>
#include <memory>
#include <string>

namespace updsrv {
namespace {

namespace fs = std::filesystem;

constexpr std::time_t kTen = 1700000000 + 10 * 3600;
constexpr std::time_t kNine = 1700000000 + 9 * 3600;

std::string Put(const testutil::TemporaryDirectory& dir, const std::string& rel, std::time_t mtime,
                const std::string& contents = "payload") {
    const std::string path = dir.Sub(rel);
    testutil::WriteFile(path, contents);
    testutil::SetMtime(path, mtime);
    return path;
}

std::string FileName(const std::optional<UpdateFileRecord>& rec) {
    return rec ? fs::path(rec->path).filename().string() : std::string("<none>");
}

AppVersion V(const char* s) { return *AppVersion::Parse(s); }

TEST(UpdateLocator, VersionFromFileName) {
    EXPECT_EQ(UpdateLocator::VersionFromFileName("demo-1.0.0.tar.gz")->ToString(), "1.0.0");
    EXPECT_EQ(UpdateLocator::VersionFromFileName("Demo-1.2.EXE")->ToString(), "1.2.0");
    EXPECT_EQ(UpdateLocator::VersionFromFileName("my-app-2.1.0.tar.gz")->ToString(), "2.1.0");

    const auto beta = UpdateLocator::VersionFromFileName("demo-1.1.0-beta.ab12cd3.tar.gz");
    ASSERT_TRUE(beta.has_value());
    EXPECT_EQ(beta->Tag(), PrereleaseTag::Beta);
    EXPECT_EQ(beta->BuildId(), "ab12cd3");

    EXPECT_FALSE(UpdateLocator::VersionFromFileName("demo.tar.gz").has_value());
    EXPECT_FALSE(UpdateLocator::VersionFromFileName("demo-latest.tar.gz").has_value());
    EXPECT_FALSE(UpdateLocator::VersionFromFileName("demo-1.0.0.zip").has_value());
}

TEST(UpdateLocator, UnversionedFileAlwaysWins) {
    testutil::TemporaryDirectory dir;
    Put(dir, "app-1.2.0.tar.gz", kTen);
    Put(dir, "app.tar.gz", kNine);

    EXPECT_EQ(FileName(UpdateLocator::ScanLatest(dir.Path(), false)), "app.tar.gz");
    EXPECT_EQ(FileName(UpdateLocator::ScanLatest(dir.Path(), true)), "app.tar.gz");
}

TEST(UpdateLocator, NewerUnversionedFileWins) {
    testutil::TemporaryDirectory dir;
    Put(dir, "app.tar.gz", kNine);
    Put(dir, "app.exe", kTen);

    EXPECT_EQ(FileName(UpdateLocator::ScanLatest(dir.Path(), false)), "app.exe");
}

TEST(UpdateLocator, HighestVersionWinsOverNewerFile) {
    testutil::TemporaryDirectory dir;
    Put(dir, "app-1.10.0.tar.gz", kNine);
    Put(dir, "app-1.9.0.tar.gz", kTen);

    const auto rec = UpdateLocator::ScanLatest(dir.Path(), false);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->version->ToString(), "1.10.0");
    EXPECT_EQ(rec->modified, kNine);
}

TEST(UpdateLocator, SameVersionFallsBackToModificationTime) {
    testutil::TemporaryDirectory dir;
    Put(dir, "app-2.0.0-beta.1.tar.gz", kNine);
    Put(dir, "app-2.0.0-beta.2.tar.gz", kTen);

    EXPECT_EQ(FileName(UpdateLocator::ScanLatest(dir.Path(), true)), "app-2.0.0-beta.2.tar.gz");
}

TEST(UpdateLocator, PrereleaseExcludedFromStableTrack) {
    testutil::TemporaryDirectory dir;
    Put(dir, "demo-1.0.0.tar.gz", kNine);
    Put(dir, "demo-1.1.0-beta.ab12cd3.tar.gz", kTen);

    const auto info = UpdateLocator::GetLatestUpdateInfo(dir.Path());
    EXPECT_EQ(FileName(info.latest_stable), "demo-1.0.0.tar.gz");
    EXPECT_EQ(FileName(info.latest_prerelease), "demo-1.1.0-beta.ab12cd3.tar.gz");

    EXPECT_EQ(FileName(UpdateLocator::SelectTrack(info, false)), "demo-1.0.0.tar.gz");
    EXPECT_EQ(FileName(UpdateLocator::SelectTrack(info, true)), "demo-1.1.0-beta.ab12cd3.tar.gz");
}

TEST(UpdateLocator, PrereleaseTrackOnlyWhenStrictlyNewer) {
    testutil::TemporaryDirectory dir;
    Put(dir, "demo-1.1.0-rc.tar.gz", kTen);
    Put(dir, "demo-1.1.0.tar.gz", kNine);

    const auto info = UpdateLocator::GetLatestUpdateInfo(dir.Path());
    EXPECT_EQ(FileName(UpdateLocator::SelectTrack(info, true)), "demo-1.1.0.tar.gz");
}

TEST(UpdateLocator, DotfilesAndDirectoriesAreIgnored) {
    testutil::TemporaryDirectory dir;
    Put(dir, ".demo-9.0.0.tar.gz", kTen);
    fs::create_directories(dir.Sub("demo-8.0.0.tar.gz"));
    Put(dir, "demo-1.0.0.tar.gz", kNine);

    EXPECT_EQ(FileName(UpdateLocator::ScanLatest(dir.Path(), true)), "demo-1.0.0.tar.gz");
}

TEST(UpdateLocator, EmptyOrMissingFolder) {
    testutil::TemporaryDirectory dir;
    EXPECT_FALSE(UpdateLocator::ScanLatest(dir.Path(), true).has_value());
    EXPECT_FALSE(UpdateLocator::ScanLatest(dir.Sub("missing"), true).has_value());
}

TEST(UpdateLocator, GetFolderUsesMappingThenFallback) {
    testutil::TemporaryDirectory root;
    fs::create_directories(root.Sub("demo-folder"));
    fs::create_directories(root.Sub("Other"));

    auto map = std::make_shared<ConfigAppFolderMap>(std::map<std::string, std::string>{{"Demo", "demo-folder"}});
    UpdateLocator locator(root.Path(), map);

    EXPECT_EQ(locator.GetFolder("Demo"), root.Sub("demo-folder"));
    EXPECT_EQ(locator.GetFolder("Other"), root.Sub("Other"));
    EXPECT_FALSE(locator.GetFolder("Unknown").has_value());
    EXPECT_FALSE(locator.GetFolder("..").has_value());
    EXPECT_FALSE(locator.GetFolder("a/b").has_value());
    EXPECT_FALSE(locator.GetFolder("").has_value());
}

TEST(UpdateLocator, GetUpdateFileForApp) {
    testutil::TemporaryDirectory root;
    Put(root, "Demo/demo-1.0.0.tar.gz", kNine);
    Put(root, "Demo/demo-1.1.0-beta.ab12cd3.tar.gz", kTen);

    UpdateLocator locator(root.Path(), nullptr);
    EXPECT_EQ(locator.GetUpdateFileForApp("Demo", false), root.Sub("Demo/demo-1.0.0.tar.gz"));
    EXPECT_EQ(locator.GetUpdateFileForApp("Demo", true), root.Sub("Demo/demo-1.1.0-beta.ab12cd3.tar.gz"));
    EXPECT_FALSE(locator.GetUpdateFileForApp("Nope", false).has_value());
}

class CheckVersionTest : public ::testing::Test {
  protected:
    void SetUp() override { file_ = Put(dir_, "demo-1.0.0.tar.gz", kTen, "contents v1"); }

    testutil::TemporaryDirectory dir_;
    std::string file_;
};

TEST_F(CheckVersionTest, NoClientInformationMeansOutOfDate) {
    EXPECT_FALSE(UpdateLocator::CheckVersion(dir_.Path(), CheckRequest{}, false));
}

TEST_F(CheckVersionTest, ComparesVersions) {
    EXPECT_TRUE(UpdateLocator::CheckVersion(dir_.Path(), {.version = V("1.0.0")}, false));
    EXPECT_TRUE(UpdateLocator::CheckVersion(dir_.Path(), {.version = V("1.2")}, false));
    EXPECT_FALSE(UpdateLocator::CheckVersion(dir_.Path(), {.version = V("0.9.0")}, false));
}

TEST_F(CheckVersionTest, ComparesModificationTime) {
    EXPECT_TRUE(UpdateLocator::CheckVersion(dir_.Path(), {.modified_since = kTen}, false));
    EXPECT_FALSE(UpdateLocator::CheckVersion(dir_.Path(), {.modified_since = kNine}, false));
    EXPECT_FALSE(UpdateLocator::CheckVersion(dir_.Path(),
                                             {.version = V("1.0.0"), .modified_since = kNine}, false));
}

TEST_F(CheckVersionTest, ChecksumIsFinalAuthority) {
    std::string md5;
    ASSERT_TRUE(DigestHexFile(DigestAlgorithm::Md5, file_, md5).is_ok());

    for (auto& c : md5) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    EXPECT_TRUE(UpdateLocator::CheckVersion(dir_.Path(),
                                            {.version = V("0.1.0"), .checksum = md5}, false));
    EXPECT_FALSE(UpdateLocator::CheckVersion(dir_.Path(),
                                             {.version = V("1.0.0"), .checksum = std::string(32, '0')}, false));
}

TEST(UpdateLocator, EmptyFolderReportsUpToDate) {
    testutil::TemporaryDirectory dir;
    EXPECT_TRUE(UpdateLocator::CheckVersion(dir.Path(), {.version = V("0.0.1")}, false));
}

} // namespace
} // namespace updsrv
