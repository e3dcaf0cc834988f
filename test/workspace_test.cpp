#include <sys/stat.h>
#include <fstream>

#include <codebox/workspace.h>

#include "utils.h"

TEST(ScopedWorkspace, AcquireAndRelease) {
  ScopedWorkspace workspace;
  EXPECT_FALSE(workspace.Valid());
  ASSERT_TRUE(workspace.Acquire(TestWorkspaceRoot()));
  ASSERT_TRUE(workspace.Valid());
  fs::path path = workspace.path();
  EXPECT_EQ(path.parent_path(), TestWorkspaceRoot());
  EXPECT_EQ(path.filename().string().rfind("codebox-", 0), 0u);

  struct stat st;
  ASSERT_EQ(stat(path.c_str(), &st), 0);
  EXPECT_EQ(st.st_mode & 07777, 0700u);

  fs::create_directories(path / "a" / "b");
  std::ofstream(path / "a" / "b" / "file") << "data";
  workspace.Release();
  EXPECT_FALSE(workspace.Valid());
  EXPECT_FALSE(fs::exists(path));
  // releasing twice is harmless
  workspace.Release();
}

TEST(ScopedWorkspace, LockedDirectories) {
  ScopedWorkspace workspace;
  ASSERT_TRUE(workspace.Acquire(TestWorkspaceRoot()));
  fs::path path = workspace.path();
  fs::create_directories(path / "d" / "e");
  std::ofstream(path / "d" / "e" / "f") << "data";
  std::ofstream(path / "d" / "g") << "data";
  ASSERT_EQ(chmod((path / "d" / "e").c_str(), 0), 0);
  ASSERT_EQ(chmod((path / "d").c_str(), 0), 0);
  ASSERT_EQ(chmod(path.c_str(), 0), 0);
  workspace.Release();
  EXPECT_FALSE(fs::exists(path));
}

TEST(RemoveAll, KeepsLinkTargetLocked) {
  fs::path outside = TestWorkspaceRoot() / "locked-target";
  fs::create_directories(outside);
  ASSERT_EQ(chmod(outside.c_str(), 0), 0);
  ScopedWorkspace workspace;
  ASSERT_TRUE(workspace.Acquire(TestWorkspaceRoot()));
  fs::path path = workspace.path();
  fs::create_directories(path / "d");
  fs::create_directory_symlink(outside, path / "d" / "link");
  ASSERT_EQ(chmod((path / "d").c_str(), 0), 0);
  workspace.Release();
  EXPECT_FALSE(fs::exists(path));
  struct stat st;
  ASSERT_EQ(stat(outside.c_str(), &st), 0);
  EXPECT_EQ(st.st_mode & 07777, 0u);
  ASSERT_EQ(chmod(outside.c_str(), 0700), 0);
  fs::remove_all(outside);
}

TEST(ScopedWorkspace, Unique) {
  ScopedWorkspace a, b;
  ASSERT_TRUE(a.Acquire(TestWorkspaceRoot()));
  ASSERT_TRUE(b.Acquire(TestWorkspaceRoot()));
  EXPECT_NE(a.path(), b.path());
}

TEST(ScopedWorkspace, RemovedOnDestruction) {
  fs::path path;
  {
    ScopedWorkspace workspace;
    ASSERT_TRUE(workspace.Acquire(TestWorkspaceRoot()));
    path = workspace.path();
    std::ofstream(path / "x") << "x";
  }
  EXPECT_FALSE(fs::exists(path));
}

TEST(ScopedWorkspace, Move) {
  ScopedWorkspace a;
  ASSERT_TRUE(a.Acquire(TestWorkspaceRoot()));
  fs::path path = a.path();
  ScopedWorkspace b(std::move(a));
  EXPECT_FALSE(a.Valid());
  EXPECT_EQ(b.path(), path);
  ScopedWorkspace c;
  ASSERT_TRUE(c.Acquire(TestWorkspaceRoot()));
  fs::path old = c.path();
  c = std::move(b);
  EXPECT_FALSE(fs::exists(old));
  EXPECT_EQ(c.path(), path);
  EXPECT_TRUE(fs::exists(path));
}

TEST(ScopedWorkspace, AlreadyRemoved) {
  ScopedWorkspace workspace;
  ASSERT_TRUE(workspace.Acquire(TestWorkspaceRoot()));
  fs::remove_all(workspace.path());
  workspace.Release();
  EXPECT_FALSE(workspace.Valid());
}

TEST(ScopedWorkspace, BadRoot) {
  ScopedWorkspace workspace;
  EXPECT_FALSE(workspace.Acquire("/proc/codebox-no-such-dir"));
  EXPECT_FALSE(workspace.Valid());
}
