#include "limit_backend.h"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sched.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <thread>
#include <fstream>
#include <algorithm>

#include <spdlog/spdlog.h>

#include <codebox/utils.h>
#include "jail.h"
#include "utils.h"

int SetRlimits(const ResourceLimitProfile& profile, bool address_space, bool processes) noexcept {
  auto Set = [](__rlimit_resource_t resource, rlim_t soft, rlim_t hard) -> int {
    struct rlimit cur;
    if (getrlimit(resource, &cur) < 0) return errno;
    struct rlimit lim;
    lim.rlim_max = std::min(hard, cur.rlim_max);
    lim.rlim_cur = std::min(soft, lim.rlim_max);
    return setrlimit(resource, &lim) < 0 ? errno : 0;
  };
  int err = 0;
  if (address_space && (err = Set(RLIMIT_AS, profile.max_address_space_bytes,
                                  profile.max_address_space_bytes))) return err;
  if (processes && (err = Set(RLIMIT_NPROC, profile.max_processes, profile.max_processes))) return err;
  // SIGXCPU at the soft limit, SIGKILL one second later
  if ((err = Set(RLIMIT_CPU, profile.max_cpu_seconds, profile.max_cpu_seconds + 1))) return err;
  if ((err = Set(RLIMIT_FSIZE, profile.max_output_bytes, profile.max_output_bytes))) return err;
  rlim_t core = profile.core_dumps_enabled ? RLIM_INFINITY : 0;
  return Set(RLIMIT_CORE, core, core);
}

bool UserNamespacesAvailable() {
  pid_t pid = fork();
  if (pid < 0) return false;
  if (pid == 0) _exit(unshare(CLONE_NEWUSER) < 0 ? 1 : 0);
  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) return false;
  }
  return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

void LimitBackend::KillAll(pid_t pid) const {
  if (kill(-pid, SIGKILL) < 0 && errno != ESRCH) {
    spdlog::warn("Failed killing process group {}: {}", pid, strerror(errno));
  }
}

namespace {

// With own_user_ns the worker first enters a user namespace of its own, so its
// RLIMIT_NPROC count is not shared with other workers running as the same uid.
class RlimitBackend : public LimitBackend {
  const bool own_user_ns_;
 public:
  explicit RlimitBackend(bool own_user_ns) : own_user_ns_(own_user_ns) {}
  LimitBackendType Type() const override { return LimitBackendType::RLIMIT; }
  int RestrictWorker(const ResourceLimitProfile& profile) const noexcept override {
    // before the limits; the namespace keeps the limits of its creator as its ceiling
    if (own_user_ns_ && unshare(CLONE_NEWUSER) < 0) return errno;
    return SetRlimits(profile, true, true);
  }
};

// Memory and process count are enforced on a cgroup v2 group per worker, so they cover
// every descendant together. The rest stays on rlimits.
class CgroupBackend : public LimitBackend {
  const fs::path root_;

  fs::path Group_(pid_t pid) const {
    return root_ / ("worker-" + std::to_string(pid));
  }
 public:
  explicit CgroupBackend(const fs::path& root) : root_(root) {}
  LimitBackendType Type() const override { return LimitBackendType::CGROUP; }

  int RestrictWorker(const ResourceLimitProfile& profile) const noexcept override {
    return SetRlimits(profile, false, false);
  }

  bool ApplyLimits(pid_t pid, const ResourceLimitProfile& profile) const override {
    fs::path group = Group_(pid);
    if (!CreateDirs(group)) return false;
    if (!WriteControl(group / "memory.max", std::to_string(profile.max_address_space_bytes))) return false;
    // absent when swap accounting is off
    std::error_code ec;
    if (fs::exists(group / "memory.swap.max", ec) &&
        !WriteControl(group / "memory.swap.max", "0")) return false;
    if (!WriteControl(group / "pids.max", std::to_string(profile.max_processes))) return false;
    if (!WriteControl(group / "cgroup.procs", std::to_string(pid))) return false;
    spdlog::debug("Worker {} attached to {}", pid, group.c_str());
    return true;
  }

  void KillAll(pid_t pid) const override {
    std::error_code ec;
    fs::path kill_file = Group_(pid) / "cgroup.kill";
    // cgroup.kill needs Linux 5.14
    if (fs::exists(kill_file, ec)) IGNORE_RETURN(WriteControl(kill_file, "1"));
    LimitBackend::KillAll(pid);
  }

  bool MemoryExceeded(pid_t pid) const override {
    std::ifstream fin(Group_(pid) / "memory.events");
    std::string key;
    long value;
    while (fin >> key >> value) {
      if (key == "oom_kill") return value > 0;
    }
    return false;
  }

  void Release(pid_t pid) const override {
    fs::path group = Group_(pid);
    std::error_code ec;
    if (!fs::exists(group, ec)) return;
    // the group stays busy until the kernel has finished tearing down its members
    for (int i = 0; i < 50; i++) {
      if (rmdir(group.c_str()) == 0 || errno == ENOENT) return;
      if (errno != EBUSY) break;
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    spdlog::warn("Failed removing cgroup {}: {}", group.c_str(), strerror(errno));
  }
};

// rlimits, plus fresh user, network, IPC and UTS namespaces entered by the worker itself.
class NamespaceBackend : public LimitBackend {
 public:
  LimitBackendType Type() const override { return LimitBackendType::NAMESPACE; }
  int RestrictWorker(const ResourceLimitProfile& profile) const noexcept override {
    if (unshare(CLONE_NEWUSER | CLONE_NEWNET | CLONE_NEWIPC | CLONE_NEWUTS) < 0) return errno;
    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) < 0) return errno;
    return SetRlimits(profile, true, true);
  }
};

// Hands the command to codebox-jail, which sets up a cjail jail and switches identity.
class JailBackend : public LimitBackend {
  const fs::path helper_;
 public:
  explicit JailBackend(const fs::path& helper) : helper_(helper) {}
  LimitBackendType Type() const override { return LimitBackendType::JAIL; }

  std::vector<std::string> WrapCommand(
      std::vector<std::string>&& command, const fs::path& workdir, int uid, int gid,
      const ResourceLimitProfile& profile, long wall_ms) const override {
    JailOptions opt;
    opt.command = std::move(command);
    opt.workdir = workdir.string();
    if (uid >= 0) opt.uid = uid;
    if (gid >= 0) opt.gid = gid;
    // the manager's own deadline fires first
    opt.wall_time = wall_ms > 0 ? (wall_ms + 1000) * 1000 : 0;
    opt.cpu_time = profile.max_cpu_seconds * 1'000'000;
    opt.vss = profile.max_address_space_bytes / 1024;
    opt.rss = opt.vss;
    opt.proc_num = profile.max_processes;
    opt.fsize = profile.max_output_bytes / 1024;
    opt.core = profile.core_dumps_enabled;
    return opt.ToArgs(helper_);
  }
  bool DropPrivileges() const override { return false; }
  int RestrictWorker(const ResourceLimitProfile&) const noexcept override { return 0; }
  bool LaunchFailed(int wait_status) const override {
    return WIFEXITED(wait_status) && WEXITSTATUS(wait_status) == kJailLaunchFailure;
  }
};

} // namespace

std::unique_ptr<LimitBackend> CreateLimitBackend(LimitBackendType type, const ExecutionOptions& options) {
  switch (type) {
    case LimitBackendType::RLIMIT: {
      // root gives every worker its own uid instead
      bool own_user_ns = geteuid() != 0 && UserNamespacesAvailable();
      if (geteuid() != 0 && !own_user_ns) {
        spdlog::warn("User namespaces unavailable; all workers share the process limit of uid {}",
                     geteuid());
      }
      return std::make_unique<RlimitBackend>(own_user_ns);
    }
    case LimitBackendType::CGROUP: {
      if (!CreateDirs(options.cgroup_root)) return nullptr;
      // controllers must be enabled for children of the root group
      IGNORE_RETURN(WriteControl(options.cgroup_root / "cgroup.subtree_control", "+memory +pids"));
      return std::make_unique<CgroupBackend>(options.cgroup_root);
    }
    case LimitBackendType::NAMESPACE:
      return std::make_unique<NamespaceBackend>();
    case LimitBackendType::JAIL: {
      if (geteuid() != 0) {
        spdlog::error("The {} limit backend must be run as root", LimitBackendName(type));
        return nullptr;
      }
      if (access(options.jail_helper.c_str(), X_OK) < 0) {
        spdlog::error("Jail helper {} is not executable: {}", options.jail_helper.c_str(), strerror(errno));
        return nullptr;
      }
      return std::make_unique<JailBackend>(options.jail_helper);
    }
  }
  __builtin_unreachable();
}
