#include "util/manifest_parser.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using namespace updsrv;

namespace {

const char* kFullManifest = R"({
  "id": "driver-v2",
  "name": "Driver v2",
  "description": "New sensor driver",
  "version": "2.0.0",
  "type": "driver",
  "appliesTo": {"minVersion": "1.0.0", "maxVersion": "2.0.0", "excludeVersions": ["1.5.0"]},
  "targetVersion": "1.9.0",
  "priority": 5,
  "dependencies": ["base"],
  "conflicts": ["driver-v1"],
  "storage": {"type": "nfs", "basePath": "/srv/upgrade", "path": "Box/driver-v2"},
  "files": [
    {"path": "driver.ko", "target": "/lib/modules", "permissions": "0644", "required": true,
     "executable": false, "explode": false, "backup": true, "runOrder": 2, "size": 4096,
     "checksum": "abc123"}
  ],
  "preInstallScript": "pre.sh",
  "postInstallScript": "post.sh",
  "rollbackScript": "rollback.sh",
  "checksum": {"algorithm": "sha256", "value": "deadbeef"},
  "metadata": {"owner": "team-a", "retries": 3}
})";

} // namespace

TEST(ManifestParserTest, ParsesEveryField) {
    ManifestParser parser;
    auto m = parser.Parse(kFullManifest);
    ASSERT_TRUE(m.has_value()) << m.error();

    EXPECT_EQ(m->id, "driver-v2");
    EXPECT_EQ(m->name, "Driver v2");
    EXPECT_EQ(m->type, "driver");
    EXPECT_EQ(m->priority, 5);
    ASSERT_TRUE(m->applies_to.has_value());
    EXPECT_EQ(m->applies_to->min_version, "1.0.0");
    EXPECT_EQ(m->applies_to->max_version, "2.0.0");
    EXPECT_EQ(m->applies_to->exclude_versions, std::vector<std::string>{"1.5.0"});
    EXPECT_EQ(m->target_version, "1.9.0");
    EXPECT_EQ(m->dependencies, std::vector<std::string>{"base"});
    EXPECT_EQ(m->conflicts, std::vector<std::string>{"driver-v1"});
    ASSERT_TRUE(m->storage.has_value());
    EXPECT_EQ(m->storage->base_path, "/srv/upgrade");
    EXPECT_EQ(m->storage->path, "Box/driver-v2");

    ASSERT_EQ(m->files.size(), 1u);
    const auto& f = m->files[0];
    EXPECT_EQ(f.path, "driver.ko");
    EXPECT_EQ(f.target, "/lib/modules");
    EXPECT_TRUE(f.required);
    EXPECT_TRUE(f.backup);
    EXPECT_FALSE(f.explode);
    EXPECT_EQ(f.run_order, 2);
    EXPECT_EQ(f.size, 4096u);
    EXPECT_EQ(m->TotalFileSize(), 4096u);

    EXPECT_EQ(m->post_install_script, "post.sh");
    ASSERT_TRUE(m->checksum.has_value());
    EXPECT_EQ(m->checksum->algorithm, "sha256");
    EXPECT_EQ(m->metadata.at("owner"), "\"team-a\"");
    EXPECT_TRUE(m->IsStandard());
}

TEST(ManifestParserTest, MinimalManifestDefaults) {
    ManifestParser parser;
    auto m = parser.Parse(R"({"id": "only-id"})");
    ASSERT_TRUE(m.has_value()) << m.error();
    EXPECT_EQ(m->priority, 0);
    EXPECT_FALSE(m->applies_to.has_value());
    EXPECT_FALSE(m->storage.has_value());
    EXPECT_TRUE(m->files.empty());
    EXPECT_TRUE(m->IsStandard());
}

TEST(ManifestParserTest, TypeMetadataSelectsKind) {
    ManifestParser parser;

    auto app = parser.Parse(R"({"id": "a", "version": "1.2.0", "metadata": {"Type": "AppUpdate"}})");
    ASSERT_TRUE(app.has_value()) << app.error();
    ASSERT_TRUE(std::holds_alternative<AppUpdate>(app->kind));
    EXPECT_EQ(std::get<AppUpdate>(app->kind).target_version, "1.2.0");

    auto self = parser.Parse(R"({"id": "u", "version": "2.1.0",
        "files": [{"path": "updater.tar.gz", "target": "/stage/updater-2.1.0"}],
        "metadata": {"Type": "UpdaterSelfUpdate"}})");
    ASSERT_TRUE(self.has_value()) << self.error();
    ASSERT_TRUE(std::holds_alternative<SelfUpdate>(self->kind));
    EXPECT_EQ(std::get<SelfUpdate>(self->kind).staging_dir, "/stage/updater-2.1.0");

    auto other = parser.Parse(R"({"id": "x", "metadata": {"Type": "Something"}})");
    ASSERT_TRUE(other.has_value());
    EXPECT_TRUE(other->IsStandard());
}

TEST(ManifestParserTest, ParserErrors) {
    struct ParseFailCase {
        std::string json;
        std::string expected_error_substr;
    };
    const std::vector<ParseFailCase> fail_cases = {
        {"not json at all", "Syntax Error"},
        {"", "Empty input"},
        {"[1, 2]", "root must be an object"},
        {R"({"name": "no id"})", "missing id"},
        {R"({"id": "x", "dependencies": "base"})", "must be an array"},
        {R"({"id": "x", "files": [{"target": "/t"}]})", "missing path"},
        {R"({"id": "x", "files": [{"path": "a", "size": -1}]})", "negative file size"},
        {R"({"id": "x", "priority": "high"})", "Internal Error"},
    };
    ManifestParser parser;
    for (const auto& c : fail_cases) {
        auto res = parser.Parse(c.json);
        ASSERT_FALSE(res.has_value()) << c.json;
        EXPECT_NE(res.error().find(c.expected_error_substr), std::string::npos)
            << c.json << " -> " << res.error();
    }
}

TEST(ManifestParserTest, SerializeWritesKindBackAndReparses) {
    UpgradeManifest m;
    m.id = "app-update-1.0.0";
    m.version = "1.0.0";
    m.priority = 100;
    m.kind = AppUpdate{.target_version = "1.0.0", .source_archive = "/apps/demo/demo-1.0.0.tar.gz"};
    FileDirective f;
    f.path = "demo-1.0.0.tar.gz";
    f.explode = true;
    f.size = 10;
    m.files.push_back(f);

    const std::string text = ManifestParser::Serialize(m);
    const auto j = nlohmann::json::parse(text);
    EXPECT_EQ(j["metadata"]["Type"], "AppUpdate");
    EXPECT_TRUE(j["files"][0]["target"].is_null());
    EXPECT_EQ(j["files"][0]["explode"], true);
    EXPECT_FALSE(j.contains("sourceArchive"));

    auto back = ManifestParser().Parse(text);
    ASSERT_TRUE(back.has_value()) << back.error();
    EXPECT_TRUE(std::holds_alternative<AppUpdate>(back->kind));
    EXPECT_EQ(back->priority, 100);
    EXPECT_EQ(back->files.size(), 1u);
}

TEST(ManifestParserTest, SerializePackageManifest) {
    PackageManifest p{.from_version = "0.9.0", .to_version = "1.0.0", .upgrades = {"a", "app-update-1.0.0"}};
    const auto j = nlohmann::json::parse(ManifestParser::Serialize(p));
    EXPECT_EQ(j["fromVersion"], "0.9.0");
    EXPECT_EQ(j["toVersion"], "1.0.0");
    ASSERT_EQ(j["upgrades"].size(), 2u);
    EXPECT_EQ(j["upgrades"][1], "app-update-1.0.0");
}
