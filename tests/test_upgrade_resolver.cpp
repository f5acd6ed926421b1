#include "testing.hpp"
#include "upgrade/upgrade_resolver.hpp"

#include <climits>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace updsrv {
namespace {

AppVersion V(const char* s) { return *AppVersion::Parse(s); }

std::vector<std::string> Ids(const ApplicableUpgradesResult& r) {
    std::vector<std::string> ids;
    for (const auto& m : r.upgrades) ids.push_back(m.id);
    return ids;
}

class UpgradeResolverTest : public ::testing::Test {
  protected:
    void SetUp() override {
        Artifact("Demo/demo-0.9.0.tar.gz", 100);
        Artifact("Demo/demo-1.0.0.tar.gz", 200);
        Artifact("Demo/demo-1.1.0-beta.ab12cd3.tar.gz", 300);
    }

    void Artifact(const std::string& rel, std::time_t offset) {
        testutil::WriteFile(root_.Sub(rel), "archive:" + rel);
        testutil::SetMtime(root_.Sub(rel), 1700000000 + offset);
    }

    void Manifest(const std::string& file, const std::string& json) {
        testutil::WriteFile(root_.Sub("Demo/upgrade-manifests/" + file), json);
    }

    UpgradeResolver MakeResolver() const {
        UpdateLocator locator(root_.Path(), nullptr);
        return UpgradeResolver(locator, UpdaterUpdates(locator, "Updater", "/opt/staging"));
    }

    testutil::TemporaryDirectory root_;
};

TEST_F(UpgradeResolverTest, OutdatedClientGetsAppUpdate) {
    ApplicableUpgradesResult out;
    auto r = MakeResolver().GetApplicableUpgrades("Demo", V("0.9.0"), false, std::nullopt, out);
    ASSERT_TRUE(r.is_ok()) << r.msg;

    EXPECT_EQ(out.target_version, "1.0.0");
    ASSERT_EQ(Ids(out), std::vector<std::string>{"app-update-1.0.0"});

    const auto& app = out.upgrades.back();
    EXPECT_EQ(app.priority, kAppUpdatePriority);
    EXPECT_EQ(app.type, "app");
    EXPECT_TRUE(app.files.empty());
    ASSERT_TRUE(app.applies_to.has_value());
    EXPECT_EQ(app.applies_to->max_version, "1.0.0");
    ASSERT_TRUE(std::holds_alternative<AppUpdate>(app.kind));
    EXPECT_EQ(std::get<AppUpdate>(app.kind).source_archive, root_.Sub("Demo/demo-1.0.0.tar.gz"));
}

TEST_F(UpgradeResolverTest, CurrentClientHasNothingToDo) {
    ApplicableUpgradesResult out;
    auto r = MakeResolver().GetApplicableUpgrades("Demo", V("1.0.0"), false, std::nullopt, out);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_TRUE(out.upgrades.empty());
    EXPECT_EQ(out.target_version, "1.0.0");
}

TEST_F(UpgradeResolverTest, PrereleaseTrackRaisesTarget) {
    ApplicableUpgradesResult out;
    auto r = MakeResolver().GetApplicableUpgrades("Demo", V("1.0.0"), true, std::nullopt, out);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(out.target_version, "1.1.0-beta.ab12cd3");
    EXPECT_EQ(Ids(out), std::vector<std::string>{"app-update-1.1.0-beta.ab12cd3"});
}

TEST_F(UpgradeResolverTest, FiltersManifestsByRangeAndTarget) {
    Manifest("a.json", R"({"id":"in-range","priority":1,
        "appliesTo":{"minVersion":"0.5.0","maxVersion":"1.0.0"}})");
    Manifest("b.json", R"({"id":"excluded","priority":2,
        "appliesTo":{"minVersion":"0.1","excludeVersions":["0.9"]}})");
    Manifest("c.json", R"({"id":"future","priority":3,"targetVersion":"1.0.5"})");
    Manifest("d.json", R"({"id":"too-old","appliesTo":{"maxVersion":"0.9.0"}})");
    Manifest("e.json", R"({"id":"open","priority":4,"targetVersion":"1.0.0"})");

    ApplicableUpgradesResult out;
    ASSERT_TRUE(MakeResolver().GetApplicableUpgrades("Demo", V("0.9.0"), false, std::nullopt, out).is_ok());
    EXPECT_EQ(Ids(out), (std::vector<std::string>{"in-range", "open", "app-update-1.0.0"}));

    ASSERT_TRUE(MakeResolver().GetApplicableUpgrades("Demo", V("0.9.0"), true, std::nullopt, out).is_ok());
    EXPECT_EQ(Ids(out), (std::vector<std::string>{"in-range", "future", "open", "app-update-1.1.0-beta.ab12cd3"}));

    // maxVersion is exclusive.
    ASSERT_TRUE(MakeResolver().GetApplicableUpgrades("Demo", V("1.0.0"), false, std::nullopt, out).is_ok());
    EXPECT_EQ(Ids(out), (std::vector<std::string>{"excluded", "open"}));
}

TEST_F(UpgradeResolverTest, EstimatesSizeFromFileDirectives) {
    Manifest("a.json", R"({"id":"fonts","files":[{"path":"a.ttf","size":100},{"path":"b.ttf","size":23}]})");
    Manifest("b.json", R"({"id":"config","files":[{"path":"c.conf","size":7}]})");

    ApplicableUpgradesResult out;
    ASSERT_TRUE(MakeResolver().GetApplicableUpgrades("Demo", V("0.9.0"), false, std::nullopt, out).is_ok());
    EXPECT_EQ(out.estimated_size, 130u);
}

TEST_F(UpgradeResolverTest, CycleAbortsResolution) {
    Manifest("x.json", R"({"id":"X","dependencies":["Y"]})");
    Manifest("y.json", R"({"id":"Y","dependencies":["X"]})");

    ApplicableUpgradesResult out;
    auto r = MakeResolver().GetApplicableUpgrades("Demo", V("0.9.0"), false, std::nullopt, out);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::DependencyCycle);
    EXPECT_TRUE(out.upgrades.empty());
}

TEST_F(UpgradeResolverTest, InjectsSelfUpdateAfterAppUpdate) {
    Artifact("Updater/updater-1.9.0.tar.gz", 10);
    Artifact("Updater/updater-2.1.0.tar.gz", 20);
    Artifact("Updater/updater-3.0.0-alpha.tar.gz", 30);

    ApplicableUpgradesResult out;
    ASSERT_TRUE(MakeResolver().GetApplicableUpgrades("Demo", V("0.9.0"), false, std::string("1.5.0"), out).is_ok());
    ASSERT_EQ(Ids(out), (std::vector<std::string>{"app-update-1.0.0", "updater-self-update-2.1.0"}));

    const auto& self = out.upgrades.back();
    EXPECT_EQ(self.priority, INT_MAX);
    EXPECT_EQ(self.type, "updater");
    ASSERT_TRUE(std::holds_alternative<SelfUpdate>(self.kind));
    const auto& kind = std::get<SelfUpdate>(self.kind);
    EXPECT_EQ(kind.staging_dir, "/opt/staging/updater-2.1.0");
    EXPECT_EQ(kind.source_archive, root_.Sub("Updater/updater-2.1.0.tar.gz"));

    // Even a current app gets the self-update.
    ASSERT_TRUE(MakeResolver().GetApplicableUpgrades("Demo", V("1.0.0"), false, std::string("2.0"), out).is_ok());
    EXPECT_EQ(Ids(out), std::vector<std::string>{"updater-self-update-2.1.0"});

    ASSERT_TRUE(MakeResolver().GetApplicableUpgrades("Demo", V("1.0.0"), false, std::string("2.1.0"), out).is_ok());
    EXPECT_TRUE(out.upgrades.empty());

    ASSERT_TRUE(MakeResolver().GetApplicableUpgrades("Demo", V("1.0.0"), false, std::string("garbage"), out).is_ok());
    EXPECT_TRUE(out.upgrades.empty());
}

TEST_F(UpgradeResolverTest, TypedDiskManifestsAreBoundToArtifacts) {
    Manifest("app.json", R"({"id":"app-bundle","priority":3,"metadata":{"Type":"AppUpdate"}})");
    Manifest("self.json", R"({"id":"updater-pin","priority":4,"metadata":{"Type":"UpdaterSelfUpdate"}})");

    // No updater release yet: the self-update manifest has nothing to ship.
    ApplicableUpgradesResult out;
    ASSERT_TRUE(MakeResolver().GetApplicableUpgrades("Demo", V("1.0.0"), false, std::nullopt, out).is_ok());
    ASSERT_EQ(Ids(out), std::vector<std::string>{"app-bundle"});
    const auto& app = std::get<AppUpdate>(out.upgrades[0].kind);
    EXPECT_EQ(app.source_archive, root_.Sub("Demo/demo-1.0.0.tar.gz"));
    EXPECT_EQ(app.target_version, "1.0.0");

    Artifact("Updater/updater-2.1.0.tar.gz", 400);
    ASSERT_TRUE(MakeResolver().GetApplicableUpgrades("Demo", V("1.0.0"), false, std::nullopt, out).is_ok());
    ASSERT_EQ(Ids(out), (std::vector<std::string>{"app-bundle", "updater-pin"}));
    const auto& self = std::get<SelfUpdate>(out.upgrades[1].kind);
    EXPECT_EQ(self.source_archive, root_.Sub("Updater/updater-2.1.0.tar.gz"));
    EXPECT_EQ(self.updater_version, "2.1.0");
    EXPECT_EQ(self.staging_dir, "/opt/staging/updater-2.1.0");
}

TEST_F(UpgradeResolverTest, UnknownAppIsNotFound) {
    ApplicableUpgradesResult out;
    auto r = MakeResolver().GetApplicableUpgrades("Nope", V("1.0.0"), false, std::nullopt, out);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::NotFound);
}

TEST_F(UpgradeResolverTest, UnversionedLatestIsNotFound) {
    Artifact("Wild/wild.tar.gz", 10);
    Artifact("Wild/wild-1.0.0.tar.gz", 20);

    ApplicableUpgradesResult out;
    auto r = MakeResolver().GetApplicableUpgrades("Wild", V("0.1.0"), false, std::nullopt, out);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::NotFound);
}

TEST(UpgradeResolverRange, Bounds) {
    const VersionRange range{.min_version = "1.0", .max_version = "2.0.0", .exclude_versions = {"1.5.0"}};

    EXPECT_TRUE(UpgradeResolver::IsVersionInRange(V("1.0.0"), range));
    EXPECT_TRUE(UpgradeResolver::IsVersionInRange(V("1.9.9"), range));
    EXPECT_FALSE(UpgradeResolver::IsVersionInRange(V("2.0.0"), range));
    EXPECT_FALSE(UpgradeResolver::IsVersionInRange(V("0.9.9"), range));
    EXPECT_FALSE(UpgradeResolver::IsVersionInRange(V("1.5"), range));
    EXPECT_TRUE(UpgradeResolver::IsVersionInRange(V("1.5.1"), range));
    EXPECT_TRUE(UpgradeResolver::IsVersionInRange(V("0.0.1"), std::nullopt));
}

TEST(UpgradeResolverRange, InvalidBoundMatchesNothing) {
    const VersionRange bad_min{.min_version = "one", .max_version = std::nullopt, .exclude_versions = {}};
    const VersionRange bad_max{.min_version = std::nullopt, .max_version = "x.y", .exclude_versions = {}};
    EXPECT_FALSE(UpgradeResolver::IsVersionInRange(V("1.0.0"), bad_min));
    EXPECT_FALSE(UpgradeResolver::IsVersionInRange(V("1.0.0"), bad_max));
}

} // namespace
} // namespace updsrv
