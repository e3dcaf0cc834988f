#include <codebox/execution.h>

#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cstdlib>
#include <unordered_set>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <codebox/paths.h>
#include <codebox/utils.h>
#include <codebox/workspace.h>
#include "identity.h"
#include "limit_backend.h"
#include "worker.h"
#include "utils.h"

namespace {

constexpr char kDefaultSearchPath[] = "/usr/local/bin:/usr/bin:/bin";
constexpr long kDefaultGraceMs = 1000;
constexpr int kUidBase = 50000, kUidPoolSize = 100;
constexpr int kDefaultWorkerGid = 65534; // nogroup

long TimevalMs(const struct timeval& tv) {
  return tv.tv_sec * 1000L + tv.tv_usec / 1000;
}

void AppendLine(std::string& str, const std::string& line) {
  if (!str.empty() && str.back() != '\n') str += '\n';
  str += line;
  str += '\n';
}

} // namespace

ExitStatus ExitStatus::Completed(int code) {
  ExitStatus ret;
  ret.kind = ExitKind::COMPLETED;
  ret.code = code;
  return ret;
}

ExitStatus ExitStatus::TimedOut(int timeout_seconds) {
  ExitStatus ret;
  ret.kind = ExitKind::TIMED_OUT;
  ret.code = timeout_seconds;
  return ret;
}

ExitStatus ExitStatus::Killed(int signal, std::string cause) {
  ExitStatus ret;
  ret.kind = ExitKind::KILLED;
  ret.code = signal;
  ret.message = std::move(cause);
  return ret;
}

ExitStatus ExitStatus::Error(std::string message) {
  ExitStatus ret;
  ret.kind = ExitKind::ERROR;
  ret.code = -1;
  ret.message = std::move(message);
  return ret;
}

std::string ExecutionResult::FormattedOutput() const {
  if (exit_status.kind == ExitKind::ERROR) return "Execution failed: " + exit_status.message;
  std::string ret = stdout_text;
  if (!stderr_text.empty()) {
    ret = ret.empty() ? stderr_text : ret + "\nErrors:\n" + stderr_text;
  }
  if (ret.empty()) return "No output";
  return ret;
}

void to_json(nlohmann::json& j, const ExecutionRequest& req) {
  j = nlohmann::json{
    {"code", req.code},
    {"timeout_seconds", req.timeout_seconds},
    {"lint", req.mode == ExecutionMode::LINT},
  };
}

void from_json(const nlohmann::json& j, ExecutionRequest& req) {
  j.at("code").get_to(req.code);
  req.timeout_seconds = j.value("timeout_seconds", kDefaultTimeoutSeconds);
  req.mode = ExecutionMode::RUN;
  if (j.contains("mode")) {
    std::string mode = j.at("mode").get<std::string>();
    if (mode == "lint") {
      req.mode = ExecutionMode::LINT;
    } else if (mode != "run") {
      throw std::invalid_argument("unknown mode " + mode);
    }
  } else if (j.value("lint", false)) {
    req.mode = ExecutionMode::LINT;
  }
}

void to_json(nlohmann::json& j, const ExitStatus& status) {
  j = nlohmann::json{{"kind", ExitKindName(status.kind)}};
  switch (status.kind) {
    case ExitKind::COMPLETED:
      j["code"] = status.code;
      break;
    case ExitKind::TIMED_OUT:
      j["timeout_seconds"] = status.code;
      break;
    case ExitKind::KILLED:
      j["signal"] = status.code;
      j["signal_name"] = SignalName(status.code);
      j["cause"] = status.message;
      break;
    case ExitKind::ERROR:
      j["message"] = status.message;
      break;
  }
}

void to_json(nlohmann::json& j, const ExecutionResult& res) {
  j = nlohmann::json{
    {"stdout", res.stdout_text},
    {"stderr", res.stderr_text},
    {"exit_status", res.exit_status},
    {"truncated", res.truncated},
    {"wall_time_ms", res.wall_time_ms},
    {"cpu_time_ms", res.cpu_time_ms},
    {"max_rss_kib", res.max_rss_kib},
  };
  if (!res.diagnostics.empty()) j["diagnostics"] = res.diagnostics;
}

ExecutionOptions::ExecutionOptions() :
    interpreter{"/usr/bin/python3"},
    analyzer{"ruff", "check", "--output-format", "json", "--no-cache"},
    env_allow(DefaultEnvAllowList()),
    backend(LimitBackendType::RLIMIT),
    worker_uid(kUidBase), worker_uids(kUidPoolSize), worker_gid(kDefaultWorkerGid),
    cgroup_root(DefaultCgroupRoot()),
    jail_helper(DefaultJailHelper()),
    grace_ms(kDefaultGraceMs) {}

std::vector<std::string> DefaultEnvAllowList() {
  return {
    "PATH", "LANG", "LANGUAGE", "LC_ALL", "LC_CTYPE", "TZ",
    "PYTHONPATH", "PYTHONIOENCODING", "OPENBLAS_NUM_THREADS",
  };
}

std::vector<std::string> GuestEnvironment(
    const std::vector<std::string>& allow, const fs::path& workspace) {
  static const std::unordered_set<std::string> kFixed = {
    "HOME", "TMPDIR", "PYTHONUNBUFFERED", "PYTHONDONTWRITEBYTECODE",
  };
  std::vector<std::string> ret;
  bool has_path = false;
  for (auto& name : allow) {
    if (kFixed.count(name)) continue;
    const char* value = getenv(name.c_str());
    if (!value) continue;
    if (name == "PATH") has_path = true;
    ret.push_back(name + "=" + value);
  }
  if (!has_path) ret.push_back(std::string("PATH=") + kDefaultSearchPath);
  ret.push_back("HOME=" + workspace.string());
  ret.push_back("TMPDIR=" + workspace.string());
  ret.push_back("PYTHONUNBUFFERED=1");
  ret.push_back("PYTHONDONTWRITEBYTECODE=1");
  return ret;
}

std::string SignalCause(int signal, double cpu_seconds, bool memory_exceeded,
                        const ResourceLimitProfile& profile) {
  switch (signal) {
    case SIGXCPU: return "CPU time limit exceeded";
    case SIGXFSZ: return "output file size limit exceeded";
    case SIGKILL:
      if (memory_exceeded) return "memory limit exceeded";
      // the hard CPU limit is one second above the soft one
      if (cpu_seconds >= profile.max_cpu_seconds) return "CPU time limit exceeded";
      return "killed (possibly memory limit exceeded)";
    case SIGSEGV: [[fallthrough]];
    case SIGBUS: return "segmentation fault (possibly memory limit exceeded)";
    case SIGABRT: return "aborted";
  }
  return "terminated by " + SignalName(signal);
}

ExitStatus ExitStatusFromWait(
    int wait_status, bool timed_out, int timeout_seconds, double cpu_seconds,
    bool memory_exceeded, const ResourceLimitProfile& profile) {
  if (timed_out) return ExitStatus::TimedOut(timeout_seconds);
  if (WIFEXITED(wait_status)) return ExitStatus::Completed(WEXITSTATUS(wait_status));
  if (WIFSIGNALED(wait_status)) {
    int sig = WTERMSIG(wait_status);
    return ExitStatus::Killed(sig, SignalCause(sig, cpu_seconds, memory_exceeded, profile));
  }
  return ExitStatus::Error(fmt::format("unexpected wait status {:#x}", wait_status));
}

ExecutionManager::ExecutionManager(const ResourceLimitProfile& profile, ExecutionOptions options) :
    profile_(profile), options_(std::move(options)) {
  if (!profile_.Valid()) throw ManagerError("invalid resource limit profile");
  if (options_.interpreter.empty() || options_.analyzer.empty()) {
    throw ManagerError("interpreter and analyzer must be set");
  }
  if (geteuid() == 0) {
    if (options_.worker_uid <= 0 || options_.worker_uids <= 0 || options_.worker_gid < 0) {
      throw ManagerError("invalid worker identities");
    }
    identities_ = std::make_unique<IdentityPool>(options_.worker_uid, options_.worker_uids);
  }
  backend_ = CreateLimitBackend(options_.backend, options_);
  if (!backend_) {
    throw ManagerError(fmt::format("Failed setting up {} limit backend",
                                   LimitBackendName(options_.backend)));
  }
  spdlog::info("Execution manager ready, limit backend {}", LimitBackendName(backend_->Type()));
}

ExecutionManager::~ExecutionManager() {}

ExecutionResult ExecutionManager::Execute(const ExecutionRequest& request,
                                          const std::atomic_bool* cancel) const {
  if (request.mode == ExecutionMode::RUN && request.timeout_seconds <= 0) {
    throw ManagerError("timeout_seconds must be positive");
  }
  ScopedWorkspace workspace;
  if (!workspace.Acquire(options_.workspace_root)) throw ManagerError("Failed creating workspace");
  fs::path script = workspace.path() / kScriptName;
  if (!WriteFile(script, request.code, kPerm644)) throw ManagerError("Failed writing code to workspace");
  spdlog::info("{} request in {}, {} bytes of code", ExecutionModeName(request.mode),
               workspace.path().c_str(), request.code.size());

  switch (request.mode) {
    case ExecutionMode::RUN: {
      IdentityPool::Lease identity;
      if (identities_) {
        identity = identities_->Take();
        if (!identity) throw ManagerError("No free worker identity");
        if (!ChownTree(workspace.path(), identity.uid(), options_.worker_gid)) {
          throw ManagerError("Failed handing workspace to the worker identity");
        }
      }
      return Run_(workspace.path(), script, request.timeout_seconds, identity.uid(), cancel);
    }
    case ExecutionMode::LINT:
      return Lint_(workspace.path(), script, cancel);
  }
  __builtin_unreachable();
}

ExecutionResult ExecutionManager::Run_(const fs::path& workspace, const fs::path& script,
                                       int timeout_seconds, int uid, const std::atomic_bool* cancel) const {
  long timeout_ms = timeout_seconds * 1000L;
  std::vector<std::string> command = options_.interpreter;
  command.push_back(script.string());
  int gid = uid >= 0 ? options_.worker_gid : -1;

  WorkerSpec spec;
  spec.command = backend_->WrapCommand(std::move(command), workspace, uid, gid, profile_, timeout_ms);
  spec.envs = GuestEnvironment(options_.env_allow, workspace);
  spec.workdir = workspace;
  if (uid >= 0 && backend_->DropPrivileges()) {
    spec.uid = uid;
    spec.gid = gid;
  }
  spec.owner_uid = uid;
  Worker worker;
  worker.Spawn(spec, backend_.get(), profile_);
  WorkerOutcome outcome = worker.Wait(timeout_ms, profile_.max_output_bytes, options_.grace_ms, cancel);
  if (!outcome.timed_out && !outcome.cancelled && backend_->LaunchFailed(outcome.wait_status)) {
    throw ManagerError("Limit backend failed to start the guest: " + outcome.err);
  }

  ExecutionResult ret;
  ret.stdout_text = std::move(outcome.out);
  ret.stderr_text = std::move(outcome.err);
  ret.truncated = outcome.truncated;
  ret.wall_time_ms = outcome.wall_ms;
  ret.cpu_time_ms = TimevalMs(outcome.usage.ru_utime) + TimevalMs(outcome.usage.ru_stime);
  ret.max_rss_kib = outcome.usage.ru_maxrss;
  if (outcome.cancelled) {
    ret.exit_status = ExitStatus::Error("cancelled");
    return ret;
  }
  ret.exit_status = ExitStatusFromWait(outcome.wait_status, outcome.timed_out, timeout_seconds,
                                       ret.cpu_time_ms / 1000.0, outcome.memory_exceeded, profile_);
  switch (ret.exit_status.kind) {
    case ExitKind::TIMED_OUT:
      AppendLine(ret.stderr_text, fmt::format("Execution terminated after {} seconds", timeout_seconds));
      break;
    case ExitKind::KILLED:
      AppendLine(ret.stderr_text, fmt::format("Process killed by {}: {}",
                                              SignalName(ret.exit_status.code), ret.exit_status.message));
      break;
    default: break;
  }
  spdlog::info("Run finished: {}, wall {} ms, cpu {} ms, rss {} KiB{}",
               ExitKindName(ret.exit_status.kind), ret.wall_time_ms, ret.cpu_time_ms,
               ret.max_rss_kib, ret.truncated ? ", truncated" : "");
  return ret;
}

ExecutionResult ExecutionManager::Lint_(const fs::path& workspace, const fs::path& script,
                                        const std::atomic_bool* cancel) const {
  WorkerSpec spec;
  spec.command = options_.analyzer;
  spec.command.push_back(script.string());
  spec.envs = GuestEnvironment(options_.env_allow, workspace);
  spec.workdir = workspace;
  Worker worker;
  worker.Spawn(spec, nullptr, profile_);
  WorkerOutcome outcome = worker.Wait(0, profile_.max_output_bytes, options_.grace_ms, cancel);

  ExecutionResult ret;
  ret.wall_time_ms = outcome.wall_ms;
  ret.cpu_time_ms = TimevalMs(outcome.usage.ru_utime) + TimevalMs(outcome.usage.ru_stime);
  ret.max_rss_kib = outcome.usage.ru_maxrss;
  if (outcome.cancelled) {
    ret.exit_status = ExitStatus::Error("cancelled");
    return ret;
  }
  // 0: clean, 1: findings reported
  if (!WIFEXITED(outcome.wait_status) || WEXITSTATUS(outcome.wait_status) > 1) {
    throw ManagerError(fmt::format("Analyzer {} failed (status {:#x}): {}",
                                   spec.command[0], outcome.wait_status, outcome.err));
  }
  int code = WEXITSTATUS(outcome.wait_status);
  // findings were reported, so a report without any was not understood
  if (outcome.truncated || !TranslateDiagnostics(outcome.out, ret.diagnostics) ||
      (code == 1 && ret.diagnostics.empty())) {
    throw ManagerError(fmt::format("Failed parsing output of analyzer {}", spec.command[0]));
  }
  ret.stdout_text = RenderDiagnostics(ret.diagnostics);
  ret.stderr_text = std::move(outcome.err);
  ret.exit_status = ExitStatus::Completed(code);
  spdlog::info("Lint finished: {} diagnostics", ret.diagnostics.size());
  return ret;
}
