#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <sys/resource.h>
#include <algorithm>

#include <codebox/utils.h>
#include <codebox/limits.h>
#include <codebox/execution.h>

#include "jail.h"
#include "limit_backend.h"
#include "utils.h"

namespace {

constexpr int kLimitCount = 5;
constexpr int kResources[kLimitCount] = {RLIMIT_AS, RLIMIT_NPROC, RLIMIT_CPU, RLIMIT_FSIZE, RLIMIT_CORE};

struct LimitReport {
  int error;
  rlimit limits[kLimitCount];
};

// Runs SetRlimits in a forked child and reports the limits it ends up with.
LimitReport RestrictChild(const ResourceLimitProfile& profile, bool address_space, bool processes) {
  LimitReport report = {};
  int fd[2];
  EXPECT_EQ(pipe(fd), 0);
  pid_t pid = fork();
  EXPECT_GE(pid, 0);
  if (pid == 0) {
    close(fd[0]);
    LimitReport ret = {};
    ret.error = SetRlimits(profile, address_space, processes);
    for (int i = 0; i < kLimitCount; i++) getrlimit((__rlimit_resource_t)kResources[i], &ret.limits[i]);
    _exit(write(fd[1], &ret, sizeof(ret)) == (ssize_t)sizeof(ret) ? 0 : 1);
  }
  close(fd[1]);
  EXPECT_EQ(read(fd[0], &report, sizeof(report)), (ssize_t)sizeof(report));
  close(fd[0]);
  int status = 0;
  EXPECT_EQ(waitpid(pid, &status, 0), pid);
  EXPECT_TRUE(WIFEXITED(status) && WEXITSTATUS(status) == 0);
  return report;
}

} // namespace

TEST(ResourceLimitProfile, Defaults) {
  ResourceLimitProfile profile;
  EXPECT_EQ(profile.max_address_space_bytes, 2L * 1024 * 1024 * 1024);
  EXPECT_EQ(profile.max_cpu_seconds, 600);
  EXPECT_EQ(profile.max_processes, 50);
  EXPECT_EQ(profile.max_output_bytes, 50L * 1024 * 1024);
  EXPECT_FALSE(profile.core_dumps_enabled);
  EXPECT_TRUE(profile.Valid());
}

TEST(ResourceLimitProfile, Invalid) {
  ResourceLimitProfile profile;
  profile.max_processes = 0;
  EXPECT_FALSE(profile.Valid());
  profile = ResourceLimitProfile();
  profile.max_cpu_seconds = -1;
  EXPECT_FALSE(profile.Valid());
}

TEST(LimitBackendType, Names) {
  EXPECT_STREQ(LimitBackendName(LimitBackendType::RLIMIT), "rlimit");
  EXPECT_STREQ(LimitBackendName(LimitBackendType::JAIL), "jail");
  EXPECT_EQ(GetLimitBackend("cgroup"), LimitBackendType::CGROUP);
  EXPECT_EQ(GetLimitBackend("namespace"), LimitBackendType::NAMESPACE);
  EXPECT_FALSE(GetLimitBackend("docker"));
}

TEST(SetRlimits, SetsEveryLimit) {
  ResourceLimitProfile profile = SmallProfile();
  LimitReport report = RestrictChild(profile, true, true);
  EXPECT_EQ(report.error, 0);
  EXPECT_EQ(report.limits[0].rlim_max, (rlim_t)profile.max_address_space_bytes);
  EXPECT_EQ(report.limits[1].rlim_cur, (rlim_t)profile.max_processes);
  EXPECT_EQ(report.limits[2].rlim_cur, (rlim_t)profile.max_cpu_seconds);
  EXPECT_EQ(report.limits[2].rlim_max, (rlim_t)profile.max_cpu_seconds + 1);
  EXPECT_EQ(report.limits[3].rlim_cur, (rlim_t)profile.max_output_bytes);
  EXPECT_EQ(report.limits[4].rlim_max, (rlim_t)0);
}

TEST(SetRlimits, SkipsAddressSpace) {
  rlimit before;
  ASSERT_EQ(getrlimit(RLIMIT_AS, &before), 0);
  rlimit nproc;
  ASSERT_EQ(getrlimit(RLIMIT_NPROC, &nproc), 0);
  LimitReport report = RestrictChild(SmallProfile(), false, false);
  EXPECT_EQ(report.error, 0);
  EXPECT_EQ(report.limits[0].rlim_max, before.rlim_max);
  EXPECT_EQ(report.limits[1].rlim_max, nproc.rlim_max);
  EXPECT_EQ(report.limits[3].rlim_cur, (rlim_t)SmallProfile().max_output_bytes);
}

// A hard limit below the profile is kept; raising it would fail without CAP_SYS_RESOURCE.
TEST(SetRlimits, ClampsToHardLimit) {
  ResourceLimitProfile profile = SmallProfile();
  profile.max_cpu_seconds = 1000;
  pid_t pid = fork();
  ASSERT_GE(pid, 0);
  if (pid == 0) {
    rlimit low = {20, 20};
    if (setrlimit(RLIMIT_CPU, &low) < 0) _exit(2);
    if (SetRlimits(profile, true, true) != 0) _exit(3);
    rlimit now;
    if (getrlimit(RLIMIT_CPU, &now) < 0) _exit(2);
    _exit(now.rlim_cur == 20 && now.rlim_max == 20 ? 0 : 1);
  }
  int status = 0;
  ASSERT_EQ(waitpid(pid, &status, 0), pid);
  ASSERT_TRUE(WIFEXITED(status));
  EXPECT_EQ(WEXITSTATUS(status), 0);
}

TEST(JailOptions, ToArgs) {
  JailOptions opt;
  opt.command = {"/usr/bin/python3", "/w/script.py"};
  opt.workdir = "/w";
  opt.uid = 1000;
  opt.gid = 1001;
  opt.wall_time = 2000000;
  opt.cpu_time = 5000000;
  opt.vss = 262144;
  opt.proc_num = 32;
  opt.fsize = 64;
  auto args = opt.ToArgs("/opt/codebox-jail");
  std::vector<std::string> expected = {
    "/opt/codebox-jail", "--workdir", "/w", "--uid", "1000", "--gid", "1001",
    "--wall-time", "2000000", "--cpu-time", "5000000", "--vss", "262144", "--rss", "0",
    "--proc-num", "32", "--fsize", "64", "--", "/usr/bin/python3", "/w/script.py",
  };
  EXPECT_EQ(args, expected);
  opt.core = true;
  args = opt.ToArgs("/opt/codebox-jail");
  EXPECT_NE(std::find(args.begin(), args.end(), "--core"), args.end());
}

TEST(CreateLimitBackend, Rlimit) {
  auto backend = CreateLimitBackend(LimitBackendType::RLIMIT, ShellOptions());
  ASSERT_TRUE(backend);
  EXPECT_EQ(backend->Type(), LimitBackendType::RLIMIT);
  EXPECT_TRUE(backend->DropPrivileges());
  std::vector<std::string> command = {"/bin/sh", "x"};
  EXPECT_EQ(backend->WrapCommand(std::move(command), "/w", -1, -1, SmallProfile(), 1000),
            (std::vector<std::string>{"/bin/sh", "x"}));
}

TEST(CreateLimitBackend, JailNeedsRoot) {
  if (geteuid() == 0) GTEST_SKIP() << "running as root";
  EXPECT_FALSE(CreateLimitBackend(LimitBackendType::JAIL, ShellOptions()));
}

TEST(CreateLimitBackend, JailWrapsCommand) {
  if (geteuid() != 0) GTEST_SKIP() << "needs root";
  ExecutionOptions options = ShellOptions();
  options.jail_helper = DefaultJailHelper();
  SKIP_UNLESS_EXECUTABLE(options.jail_helper.string());
  auto backend = CreateLimitBackend(LimitBackendType::JAIL, options);
  ASSERT_TRUE(backend);
  EXPECT_FALSE(backend->DropPrivileges());
  auto args = backend->WrapCommand({"/bin/sh", "x"}, "/w", 50001, 65534, SmallProfile(), 3000);
  ASSERT_GE(args.size(), 3u);
  auto uid = std::find(args.begin(), args.end(), "--uid");
  ASSERT_NE(uid, args.end());
  EXPECT_EQ(*(uid + 1), "50001");
  EXPECT_EQ(args[0], options.jail_helper.string());
  EXPECT_EQ(args[args.size() - 3], "--");
  EXPECT_TRUE(backend->LaunchFailed(kJailLaunchFailure << 8));
  EXPECT_FALSE(backend->LaunchFailed(0));
}

// The namespace backend cuts the guest off from the host network.
TEST(LimitBackendRun, Namespace) {
  ExecutionOptions options = ShellOptions();
  options.backend = LimitBackendType::NAMESPACE;
  ExecutionManager manager(SmallProfile(), options);
  ExecutionResult result;
  try {
    result = manager.Execute(ExecutionRequest(
        "tail -n +3 /proc/net/dev | cut -d: -f1 | tr -d ' '", 5, ExecutionMode::RUN));
  } catch (ManagerError& e) {
    GTEST_SKIP() << "namespaces unavailable: " << e.what();
  }
  EXPECT_EQ(result.exit_status.kind, ExitKind::COMPLETED);
  EXPECT_EQ(result.stdout_text, "lo\n");
}

TEST(LimitBackendRun, Cgroup) {
  if (geteuid() != 0) GTEST_SKIP() << "needs root";
  ExecutionOptions options = ShellOptions();
  options.backend = LimitBackendType::CGROUP;
  options.cgroup_root = fs::path("/sys/fs/cgroup") / ("codebox-test-" + std::to_string(getpid()));
  ExecutionResult result;
  try {
    ExecutionManager manager(SmallProfile(), options);
    result = manager.Execute(ExecutionRequest("echo hi", 5, ExecutionMode::RUN));
  } catch (ManagerError& e) {
    GTEST_SKIP() << "cgroup v2 unavailable: " << e.what();
  }
  EXPECT_EQ(result.exit_status.kind, ExitKind::COMPLETED);
  EXPECT_EQ(result.stdout_text, "hi\n");
  // worker groups are removed once reaped
  for (auto& entry : fs::directory_iterator(options.cgroup_root)) {
    EXPECT_FALSE(entry.is_directory()) << entry.path();
  }
  rmdir(options.cgroup_root.c_str());
}
