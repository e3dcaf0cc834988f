#ifndef CODEBOX_LIMIT_BACKEND_H_
#define CODEBOX_LIMIT_BACKEND_H_

#include <memory>
#include <string>
#include <vector>
#include <filesystem>

#include <sys/types.h>

#include <codebox/limits.h>
#include <codebox/execution.h>

// How a ResourceLimitProfile is enforced on one worker process.
// The worker is forked, drops privileges and runs RestrictWorker() on its own side, then
// parks until the manager has called ApplyLimits() on it; only then does it exec the guest.
class LimitBackend {
 public:
  virtual ~LimitBackend() {}
  virtual LimitBackendType Type() const = 0;

  // Chance to run the command through a helper. workdir is the worker's working directory;
  // uid and gid are the identity the guest should run under (-1 = the manager's).
  virtual std::vector<std::string> WrapCommand(
      std::vector<std::string>&& command, const std::filesystem::path& workdir, int uid, int gid,
      const ResourceLimitProfile& profile, long wall_ms) const {
    return std::move(command);
  }
  // Whether the worker should switch to the unprivileged identity itself.
  virtual bool DropPrivileges() const { return true; }
  // Runs in the forked worker after it dropped privileges; async-signal-safe only.
  // Returns 0 or an errno value.
  virtual int RestrictWorker(const ResourceLimitProfile& profile) const noexcept = 0;
  // Runs in the manager while the worker is parked.
  virtual bool ApplyLimits(pid_t pid, const ResourceLimitProfile& profile) const { return true; }
  // Kills everything the worker started. pid is also the process group id.
  virtual void KillAll(pid_t pid) const;
  // Whether the worker was stopped by the memory ceiling, if the backend can tell.
  virtual bool MemoryExceeded(pid_t pid) const { return false; }
  // Whether the wait status means the backend failed before the guest started.
  virtual bool LaunchFailed(int wait_status) const { return false; }
  // Called once the worker has been reaped.
  virtual void Release(pid_t pid) const {}
};

std::unique_ptr<LimitBackend> CreateLimitBackend(LimitBackendType type, const ExecutionOptions& options);

// setrlimit(2) the profile onto the calling process, never above its current hard limits.
// CPU, file size and core dumps are always set. Async-signal-safe; returns 0 or an errno value.
int SetRlimits(const ResourceLimitProfile& profile, bool address_space, bool processes) noexcept;

// Whether this process may create user namespaces. Since Linux 5.14 RLIMIT_NPROC is
// counted per user namespace, which gives each worker its own process count.
bool UserNamespacesAvailable();

#endif  // CODEBOX_LIMIT_BACKEND_H_
