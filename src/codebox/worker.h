#ifndef CODEBOX_WORKER_H_
#define CODEBOX_WORKER_H_

#include <atomic>
#include <chrono>
#include <string>
#include <vector>
#include <filesystem>

#include <sys/types.h>
#include <sys/resource.h>

#include <codebox/limits.h>
#include "limit_backend.h"
#include "utils.h"

class WorkerSpec {
 public:
  std::vector<std::string> command; // resolved against PATH in envs
  std::vector<std::string> envs;
  fs::path workdir;
  int uid, gid; // -1 = keep the manager's identity
  // every process running as owner_uid is killed with the worker; -1 = none
  int owner_uid;

  WorkerSpec() : uid(-1), gid(-1), owner_uid(-1) {}
};

struct WorkerOutcome {
  std::string out, err;
  bool truncated;
  bool timed_out;
  bool cancelled;
  bool memory_exceeded; // as reported by the limit backend
  int wait_status;
  struct rusage usage;
  long wall_ms;

  WorkerOutcome() :
      truncated(false), timed_out(false), cancelled(false), memory_exceeded(false),
      wait_status(0), usage{}, wall_ms(0) {}
};

// One guest process and its process group. The group is killed and the leader reaped
// when the Worker is destroyed, if Wait() has not done so already.
class Worker {
  pid_t pid_;
  bool reaped_;
  bool memory_exceeded_;
  const LimitBackend* backend_;
  int owner_uid_;
  ino_t user_ns_; // 0 = the manager's
  UniqueFd out_, err_;
  std::chrono::steady_clock::time_point start_;

  void KillAll_();
  void KillNamespace_();
  int Reap_(struct rusage* usage);
  void Abort_();
 public:
  Worker() :
      pid_(-1), reaped_(false), memory_exceeded_(false), backend_(nullptr),
      owner_uid_(-1), user_ns_(0) {}
  ~Worker();
  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;

  // backend may be null, in which case no limits are applied. Throws ManagerError.
  void Spawn(const WorkerSpec& spec, const LimitBackend* backend, const ResourceLimitProfile& profile);
  // Collects output until the leader exits, then kills whatever is left of the group,
  // along with processes that escaped it under the owner uid or in the worker's user namespace.
  // timeout_ms <= 0 means no deadline. Each stream keeps at most max_output bytes.
  WorkerOutcome Wait(long timeout_ms, size_t max_output, long grace_ms,
                     const std::atomic_bool* cancel = nullptr);

  pid_t pid() const { return pid_; }
};

#endif  // CODEBOX_WORKER_H_
