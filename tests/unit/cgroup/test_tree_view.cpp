#include <gtest/gtest.h>

#include <cgfs/cgroup/tree_view.hpp>
#include <cgfs/core/error.hpp>

#include "support/fake_cgroup_client.hpp"

using namespace cgfs;

class CgroupTreeViewTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        client_.addController("cpuset");
        client_.setValue("cpuset", "/", "cpuset.cpus", "0-3");
        client_.node("cpuset", "/").children = {"web"};

        auto& web = client_.node("cpuset", "/web");
        web.keys["cpuset.cpus"] = {"1,3", 1000, 1000, 0664};
        web.keys["cgroup.event_control"] = {"", 0, 0, 0222};
        web.children = {"api"};
        client_.node("cpuset", "/web/api");
    }

    cgfs_test::FakeCgroupClient client_;
    CgroupTreeView tree_{client_};
};

TEST_F(CgroupTreeViewTest, EmptyCgroupListsOnlyDotEntries)
{
    auto entries = tree_.listEntries("cpuset", "/web/api");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].name, ".");
    EXPECT_EQ(entries[1].name, "..");
    EXPECT_EQ(entries[0].kind, EntryKind::DIRECTORY);
    EXPECT_EQ(entries[1].mode, 0755u);
}

TEST_F(CgroupTreeViewTest, KeysBeforeChildren)
{
    auto entries = tree_.listEntries("cpuset", "/web");
    ASSERT_EQ(entries.size(), 5u);
    EXPECT_EQ(entries[2].name, "cgroup.event_control");
    EXPECT_EQ(entries[3].name, "cpuset.cpus");
    EXPECT_EQ(entries[3].kind, EntryKind::FILE);
    EXPECT_EQ(entries[3].mode, 0664u);
    EXPECT_EQ(entries[3].uid, 1000u);
    EXPECT_EQ(entries[3].gid, 1000u);
    EXPECT_EQ(entries[4].name, "api");
    EXPECT_EQ(entries[4].kind, EntryKind::DIRECTORY);
    EXPECT_EQ(entries[4].uid, 0u);
}

TEST_F(CgroupTreeViewTest, FileSizeIncludesNewline)
{
    ResolvedEntry resolved = tree_.resolveAttributes("cpuset", "/web", "cpuset.cpus");
    EXPECT_EQ(resolved.entry.kind, EntryKind::FILE);
    EXPECT_EQ(resolved.size, 4u);
}

TEST_F(CgroupTreeViewTest, EventControlIsNeverRead)
{
    int reads_before = client_.valueReads();
    ResolvedEntry resolved = tree_.resolveAttributes("cpuset", "/web", "cgroup.event_control");
    EXPECT_EQ(resolved.size, 0u);
    EXPECT_EQ(resolved.entry.mode, 0222u);
    EXPECT_EQ(client_.valueReads(), reads_before);

    try {
        tree_.readKey("cpuset", "/web", "cgroup.event_control");
        FAIL() << "Expected FsError";
    }
    catch (const FsError& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::NOT_FOUND);
    }
}

TEST_F(CgroupTreeViewTest, ChildDirectoryResolves)
{
    ResolvedEntry resolved = tree_.resolveAttributes("cpuset", "/", "web");
    EXPECT_EQ(resolved.entry.kind, EntryKind::DIRECTORY);
    EXPECT_EQ(resolved.size, 0u);
}

TEST_F(CgroupTreeViewTest, UnknownEntriesAreNotFound)
{
    for (const char* name : {"missing", ".", "..", ""}) {
        try {
            tree_.resolveAttributes("cpuset", "/web", name);
            FAIL() << "Expected FsError for '" << name << "'";
        }
        catch (const FsError& e) {
            EXPECT_EQ(e.getErrorCode(), ErrorCode::NOT_FOUND);
        }
    }
    EXPECT_THROW(tree_.listEntries("cpuset", "/nowhere"), FsError);
}

TEST_F(CgroupTreeViewTest, ReadKeyAppendsNewline)
{
    EXPECT_EQ(tree_.readKey("cpuset", "/web", "cpuset.cpus"), "1,3\n");
    EXPECT_EQ(tree_.readKey("cpuset", "/", "cpuset.cpus"), "0-3\n");
}

TEST_F(CgroupTreeViewTest, ServiceFailurePropagates)
{
    client_.failOn("cpuset", "/web", "cpuset.cpus");
    try {
        tree_.readKey("cpuset", "/web", "cpuset.cpus");
        FAIL() << "Expected FsError";
    }
    catch (const FsError& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::SERVICE_FAILURE);
    }
}
