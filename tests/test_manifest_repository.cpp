#include "testing.hpp"
#include "upgrade/manifest_repository.hpp"

#include <gtest/gtest.h>
#include <string>

namespace updsrv {
namespace {

std::vector<std::string> Ids(const std::vector<UpgradeManifest>& manifests) {
    std::vector<std::string> ids;
    for (const auto& m : manifests) ids.push_back(m.id);
    return ids;
}

TEST(ManifestRepository, MissingDirectoryIsEmpty) {
    testutil::TemporaryDirectory temp;
    ManifestRepository repo;
    EXPECT_TRUE(repo.LoadAll(temp.Sub("does-not-exist")).empty());
}

TEST(ManifestRepository, LoadsJsonFilesInNameOrder) {
    testutil::TemporaryDirectory temp;
    testutil::WriteFile(temp.Sub("b.json"), R"({"id":"second","priority":1})");
    testutil::WriteFile(temp.Sub("a.json"), R"({"id":"first","priority":2})");
    testutil::WriteFile(temp.Sub("notes.txt"), R"({"id":"ignored"})");

    ManifestRepository repo;
    const auto all = repo.LoadAll(temp.Path());
    EXPECT_EQ(Ids(all), (std::vector<std::string>{"first", "second"}));
    EXPECT_EQ(all[0].priority, 2);
}

TEST(ManifestRepository, MalformedFilesAreSkipped) {
    testutil::TemporaryDirectory temp;
    testutil::WriteFile(temp.Sub("1.json"), R"({"id":"good-1"})");
    testutil::WriteFile(temp.Sub("2.json"), R"({"id": )");
    testutil::WriteFile(temp.Sub("3.json"), R"({"name":"no id"})");
    testutil::WriteFile(temp.Sub("4.json"), R"({"id":"bad-files","files":{}})");
    testutil::WriteFile(temp.Sub("5.json"), R"({"id":"good-2","dependencies":["good-1"]})");

    ManifestRepository repo;
    const auto all = repo.LoadAll(temp.Path());
    EXPECT_EQ(Ids(all), (std::vector<std::string>{"good-1", "good-2"}));
    EXPECT_EQ(all[1].dependencies, std::vector<std::string>{"good-1"});
}

TEST(ManifestRepository, ManifestDirLivesInsideAppFolder) {
    EXPECT_EQ(ManifestRepository::ManifestDirFor("/srv/apps/demo"), "/srv/apps/demo/upgrade-manifests");
}

} // namespace
} // namespace updsrv
