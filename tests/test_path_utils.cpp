#include <gtest/gtest.h>

#include "util/path_utils.hpp"

TEST(PathUtilsTest, EndsWith) {
    EXPECT_TRUE(updsrv::EndsWith("demo-1.0.0.tar.gz", ".tar.gz"));
    EXPECT_TRUE(updsrv::EndsWith(".gz", ".gz"));
    EXPECT_FALSE(updsrv::EndsWith("gz", ".gz"));
    EXPECT_FALSE(updsrv::EndsWith("demo.tar", ".tar.gz"));
}

TEST(PathUtilsTest, NormalizeTarPathCleansInput) {
    EXPECT_EQ(updsrv::NormalizeTarPath("./manifest.json"), "manifest.json");
    EXPECT_EQ(updsrv::NormalizeTarPath("/upgrade//upgrades///a"), "upgrade/upgrades/a");
    EXPECT_EQ(updsrv::NormalizeTarPath("upgrade\\run.sh"), "upgrade/run.sh");
    EXPECT_EQ(updsrv::NormalizeTarPath(""), "");
}

TEST(PathUtilsTest, IsWithinRoot) {
    EXPECT_TRUE(updsrv::IsWithinRoot("/srv/apps", "/srv/apps/demo/x"));
    EXPECT_TRUE(updsrv::IsWithinRoot("/srv/apps/", "/srv/apps"));
    EXPECT_FALSE(updsrv::IsWithinRoot("/srv/apps", "/srv/apps/../etc/passwd"));
    EXPECT_FALSE(updsrv::IsWithinRoot("/srv/apps", "/srv/apps-other/x"));
}
