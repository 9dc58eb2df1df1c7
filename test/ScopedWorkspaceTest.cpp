#include "gtest/gtest.h"
#include "Common.h"
#include "ScopedWorkspace.hpp"
#include <fstream>

using namespace PerceptualDedup;

TEST(ScopedWorkspaceTest, CreatesOwnerOnlyDirectory) {
    ScopedWorkspace ws("dedup_test_");
    ASSERT_TRUE(fs::is_directory(ws.path()));
    EXPECT_EQ(ws.path().filename().string().rfind("dedup_test_", 0), 0u);

    auto perms = fs::status(ws.path()).permissions();
    EXPECT_EQ(perms & fs::perms::all, fs::perms::owner_all);
}

TEST(ScopedWorkspaceTest, RemovedWhenScopeEnds) {
    fs::path kept;
    {
        ScopedWorkspace ws;
        kept = ws.path();
        fs::path sub = ws.subdir("unique_images/nested");
        std::ofstream(sub / "file.bin") << "data";
        ASSERT_TRUE(fs::exists(sub / "file.bin"));
    }
    EXPECT_FALSE(fs::exists(kept));
}

TEST(ScopedWorkspaceTest, RemovedWhenExceptionUnwinds) {
    fs::path kept;
    try {
        ScopedWorkspace ws;
        kept = ws.path();
        ws.subdir("staging");
        throw DedupException("structural failure");
    } catch (const DedupException&) {
    }
    ASSERT_FALSE(kept.empty());
    EXPECT_FALSE(fs::exists(kept));
}

TEST(ScopedWorkspaceTest, DistinctRunsGetDistinctDirectories) {
    ScopedWorkspace a;
    ScopedWorkspace b;
    EXPECT_NE(a.path().string(), b.path().string());
}

TEST(ScopedWorkspaceTest, CreatedUnderGivenParent) {
    ScopedWorkspace outer("dedup_parent_");
    fs::path kept;
    {
        ScopedWorkspace inner(".pending_", outer.path());
        kept = inner.path();
        EXPECT_EQ(inner.path().parent_path().string(), outer.path().string());
        EXPECT_TRUE(fs::is_directory(inner.path()));
    }
    EXPECT_FALSE(fs::exists(kept));
    EXPECT_TRUE(fs::is_empty(outer.path()));
}
