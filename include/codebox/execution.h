#ifndef INCLUDE_CODEBOX_EXECUTION_H_
#define INCLUDE_CODEBOX_EXECUTION_H_

#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <stdexcept>
#include <filesystem>

#include <nlohmann/json_fwd.hpp>

#include "limits.h"
#include "diagnostics.h"

constexpr int kDefaultTimeoutSeconds = 10;

#define ENUM_EXECUTION_MODE_ \
  X(RUN) \
  X(LINT)
enum class ExecutionMode {
#define X(name) name,
  ENUM_EXECUTION_MODE_
#undef X
};

#define ENUM_EXIT_KIND_ \
  X(COMPLETED, "completed") \
  X(TIMED_OUT, "timed_out") \
  X(KILLED, "killed") \
  X(ERROR, "error")
enum class ExitKind {
#define X(name, repr) name,
  ENUM_EXIT_KIND_
#undef X
};

class ExecutionRequest {
 public:
  std::string code;
  int timeout_seconds; // ignored for LINT
  ExecutionMode mode;

  ExecutionRequest() : timeout_seconds(kDefaultTimeoutSeconds), mode(ExecutionMode::RUN) {}
  ExecutionRequest(std::string code, int timeout_seconds, ExecutionMode mode) :
      code(std::move(code)), timeout_seconds(timeout_seconds), mode(mode) {}
};

struct ExitStatus {
  ExitKind kind;
  // COMPLETED: exit code; KILLED: signal number; TIMED_OUT: the timeout in seconds
  int code;
  // KILLED: human-readable cause; ERROR: what went wrong
  std::string message;

  ExitStatus() : kind(ExitKind::COMPLETED), code(0) {}

  static ExitStatus Completed(int code);
  static ExitStatus TimedOut(int timeout_seconds);
  static ExitStatus Killed(int signal, std::string cause);
  static ExitStatus Error(std::string message);
};

class ExecutionResult {
 public:
  std::string stdout_text, stderr_text;
  ExitStatus exit_status;
  bool truncated;
  std::vector<DiagnosticRecord> diagnostics; // LINT only; also rendered into stdout_text
  // statistics of the worker
  long wall_time_ms, cpu_time_ms, max_rss_kib;

  ExecutionResult() : truncated(false), wall_time_ms(0), cpu_time_ms(0), max_rss_kib(0) {}

  // Text shown to a human: stdout, then "Errors:" and stderr.
  std::string FormattedOutput() const;
};

void to_json(nlohmann::json&, const ExecutionRequest&);
void from_json(const nlohmann::json&, ExecutionRequest&);
void to_json(nlohmann::json&, const ExitStatus&);
void to_json(nlohmann::json&, const ExecutionResult&);

// Conditions the manager cannot service itself (workspace or process creation, a broken
// analysis tool). Guest-controlled outcomes are never reported this way.
class ManagerError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class ExecutionOptions {
 public:
  std::filesystem::path workspace_root; // empty = system temp directory
  std::vector<std::string> interpreter; // the script path is appended
  std::vector<std::string> analyzer; // the script path is appended
  std::vector<std::string> env_allow;
  LimitBackendType backend;
  // when running as root, each live worker runs under its own uid from
  // [worker_uid, worker_uid + worker_uids) and group worker_gid
  int worker_uid, worker_uids, worker_gid;
  std::filesystem::path cgroup_root;
  std::filesystem::path jail_helper;
  long grace_ms; // reaping and draining after a kill

  ExecutionOptions();
};

// Names of the inherited variables a guest may see.
std::vector<std::string> DefaultEnvAllowList();
// "NAME=value" entries handed to a guest running in workspace.
std::vector<std::string> GuestEnvironment(
    const std::vector<std::string>& allow, const std::filesystem::path& workspace);

// Maps how the worker ended to a result variant. wait_status is as returned by waitpid.
ExitStatus ExitStatusFromWait(
    int wait_status, bool timed_out, int timeout_seconds, double cpu_seconds,
    bool memory_exceeded, const ResourceLimitProfile& profile);
std::string SignalCause(int signal, double cpu_seconds, bool memory_exceeded,
                        const ResourceLimitProfile& profile);

class LimitBackend;
class IdentityPool;

// Runs one ExecutionRequest per call, each in its own worker process and workspace.
// Execute may be called from several threads at once.
class ExecutionManager {
 public:
  explicit ExecutionManager(const ResourceLimitProfile& profile,
                            ExecutionOptions options = ExecutionOptions());
  ~ExecutionManager();
  ExecutionManager(const ExecutionManager&) = delete;
  ExecutionManager& operator=(const ExecutionManager&) = delete;

  // Throws ManagerError, also when every worker uid is in use. If cancel becomes true the
  // worker is killed and an ERROR result is returned.
  ExecutionResult Execute(const ExecutionRequest& request,
                          const std::atomic_bool* cancel = nullptr) const;

  const ResourceLimitProfile& profile() const { return profile_; }
  const ExecutionOptions& options() const { return options_; }

 private:
  ExecutionResult Run_(const std::filesystem::path& workspace, const std::filesystem::path& script,
                       int timeout_seconds, int uid, const std::atomic_bool* cancel) const;
  ExecutionResult Lint_(const std::filesystem::path& workspace, const std::filesystem::path& script,
                        const std::atomic_bool* cancel) const;
  const ResourceLimitProfile profile_;
  const ExecutionOptions options_;
  std::unique_ptr<LimitBackend> backend_;
  std::unique_ptr<IdentityPool> identities_; // null unless running as root
};

#endif  // INCLUDE_CODEBOX_EXECUTION_H_
