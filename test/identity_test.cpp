#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>

#include <gtest/gtest.h>

#include "identity.h"
#include "utils.h"

TEST(IdentityPool, LowestFirst) {
  IdentityPool pool(50000, 3);
  EXPECT_EQ(pool.Available(), 3u);
  auto a = pool.Take();
  auto b = pool.Take();
  ASSERT_TRUE(a);
  ASSERT_TRUE(b);
  EXPECT_EQ(a.uid(), 50000);
  EXPECT_EQ(b.uid(), 50001);
  EXPECT_EQ(pool.Available(), 1u);
}

TEST(IdentityPool, Exhausted) {
  IdentityPool pool(50000, 1);
  auto a = pool.Take();
  ASSERT_TRUE(a);
  auto b = pool.Take();
  EXPECT_FALSE(b);
  EXPECT_EQ(b.uid(), -1);
  a.Reset();
  EXPECT_FALSE(a);
  EXPECT_EQ(pool.Available(), 1u);
  b = pool.Take();
  EXPECT_EQ(b.uid(), 50000);
}

TEST(IdentityPool, LeaseMoves) {
  IdentityPool pool(50000, 2);
  {
    auto a = pool.Take();
    IdentityPool::Lease b(std::move(a));
    EXPECT_FALSE(a);
    EXPECT_EQ(b.uid(), 50000);
    EXPECT_EQ(pool.Available(), 1u);
    b = pool.Take();
    // the first identity went back when b was reassigned
    EXPECT_EQ(b.uid(), 50001);
    EXPECT_EQ(pool.Available(), 1u);
  }
  EXPECT_EQ(pool.Available(), 2u);
}

TEST(KillUser, KillsEveryProcess) {
  if (geteuid() != 0) GTEST_SKIP() << "needs root";
  constexpr int kUid = 51500;
  pid_t pid = fork();
  ASSERT_GE(pid, 0);
  if (pid == 0) {
    if (setsid() < 0 || setuid(kUid) < 0) _exit(1);
    execl("/bin/sleep", "sleep", "60", (char*)nullptr);
    _exit(1);
  }
  usleep(100000);
  ASSERT_TRUE(ProcessAlive(pid));
  KillUser(kUid);
  int status = 0;
  ASSERT_EQ(waitpid(pid, &status, 0), pid);
  ASSERT_TRUE(WIFSIGNALED(status));
  EXPECT_EQ(WTERMSIG(status), SIGKILL);
}

TEST(KillUser, IgnoresOwnUid) {
  // would otherwise take down the test itself
  KillUser(getuid());
  KillUser(-1);
  SUCCEED();
}
