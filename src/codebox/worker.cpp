#include "worker.h"

#include <fcntl.h>
#include <grp.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <sys/syscall.h>
#include <linux/close_range.h>
#include <cerrno>
#include <cstring>
#include <algorithm>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <codebox/execution.h>
#include "identity.h"

namespace {

// worker -> manager over the status pipe
enum class WorkerStage : int {
  READY,
  REDIRECT,
  CHDIR,
  IDENTITY,
  RESTRICT,
  EXEC,
};

struct StageRecord {
  WorkerStage stage;
  int err;
};

const char* WorkerStageName(WorkerStage stage) {
  switch (stage) {
    case WorkerStage::READY: return "ready";
    case WorkerStage::REDIRECT: return "redirecting stdio";
    case WorkerStage::CHDIR: return "entering workspace";
    case WorkerStage::IDENTITY: return "dropping privileges";
    case WorkerStage::RESTRICT: return "restricting worker";
    case WorkerStage::EXEC: return "exec";
  }
  __builtin_unreachable();
}

constexpr long kPollIntervalMs = 10;
constexpr size_t kReadBufferSize = 65536;
constexpr int kKillRounds = 20;

// 0 = EOF, -1 = error; partial records are not possible for writes below PIPE_BUF
ssize_t ReadRecord(int fd, StageRecord& record) {
  ssize_t n;
  do {
    n = read(fd, &record, sizeof(record));
  } while (n < 0 && errno == EINTR);
  return n;
}

[[noreturn]] void ChildFail(int fd, WorkerStage stage) {
  StageRecord record{stage, errno};
  IGNORE_RETURN(write(fd, &record, sizeof(record)));
  _exit(127);
}

long MillisecondsSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start).count();
}

// false on EOF or a hard error
bool Collect(int fd, std::string& buf, size_t max_output, bool& truncated) {
  char tmp[kReadBufferSize];
  while (true) {
    ssize_t n = read(fd, tmp, sizeof(tmp));
    if (n < 0) {
      if (errno == EINTR) continue;
      return errno == EAGAIN;
    }
    if (n == 0) return false;
    size_t room = buf.size() < max_output ? max_output - buf.size() : 0;
    if ((size_t)n > room) truncated = true;
    buf.append(tmp, std::min((size_t)n, room));
  }
}

// 0 if it cannot be read
ino_t UserNamespace(const std::string& proc_dir) {
  struct stat st;
  if (stat((proc_dir + "/ns/user").c_str(), &st) < 0) return 0;
  return st.st_ino;
}

} // namespace

void Worker::Spawn(const WorkerSpec& spec, const LimitBackend* backend, const ResourceLimitProfile& profile) {
  if (pid_ > 0) throw ManagerError("worker already spawned");
  if (spec.command.empty()) throw ManagerError("empty worker command");
  std::string search_path;
  for (auto& i : spec.envs) {
    if (i.compare(0, 5, "PATH=") == 0) search_path = i.substr(5);
  }
  fs::path program = FindExecutable(spec.command[0], search_path);
  if (program.empty()) {
    throw ManagerError(fmt::format("cannot find executable {}", spec.command[0]));
  }

  // everything the child touches is prepared before fork
  std::vector<char*> argv, envp;
  for (auto& i : spec.command) argv.push_back(const_cast<char*>(i.c_str()));
  argv.push_back(nullptr);
  for (auto& i : spec.envs) envp.push_back(const_cast<char*>(i.c_str()));
  envp.push_back(nullptr);
  UniqueFd out_r, out_w, err_r, err_w, status_r, status_w, go_r, go_w;
  if (!MakePipe(out_r, out_w) || !MakePipe(err_r, err_w) ||
      !MakePipe(status_r, status_w) || !MakePipe(go_r, go_w)) {
    throw ManagerError(fmt::format("pipe: {}", strerror(errno)));
  }
  UniqueFd null_fd(open("/dev/null", O_RDONLY | O_CLOEXEC));
  if (!null_fd) throw ManagerError(fmt::format("open /dev/null: {}", strerror(errno)));
  const char* workdir = spec.workdir.c_str();
  bool drop = spec.uid >= 0 && spec.gid >= 0;
  sigset_t empty_mask;
  sigemptyset(&empty_mask);
  struct sigaction default_action = {};
  default_action.sa_handler = SIG_DFL;

  start_ = std::chrono::steady_clock::now();
  pid_t pid = fork();
  if (pid < 0) throw ManagerError(fmt::format("fork: {}", strerror(errno)));
  if (pid == 0) {
    // async-signal-safe calls only until execve
    int status_fd = status_w.Get();
    setpgid(0, 0);
    sigaction(SIGPIPE, &default_action, nullptr);
    sigprocmask(SIG_SETMASK, &empty_mask, nullptr);
    if (dup2(null_fd.Get(), 0) < 0 || dup2(out_w.Get(), 1) < 0 || dup2(err_w.Get(), 2) < 0) {
      ChildFail(status_fd, WorkerStage::REDIRECT);
    }
    // descriptors opened elsewhere in the manager without O_CLOEXEC
    if (syscall(SYS_close_range, 3, ~0U, CLOSE_RANGE_CLOEXEC) < 0 && errno != ENOSYS) {
      ChildFail(status_fd, WorkerStage::REDIRECT);
    }
    if (chdir(workdir) < 0) ChildFail(status_fd, WorkerStage::CHDIR);
    if (drop) {
      if (setgroups(0, nullptr) < 0 || setgid(spec.gid) < 0 || setuid(spec.uid) < 0) {
        ChildFail(status_fd, WorkerStage::IDENTITY);
      }
    }
    if (backend) {
      if (int err = backend->RestrictWorker(profile)) {
        errno = err;
        ChildFail(status_fd, WorkerStage::RESTRICT);
      }
    }
    StageRecord ready{WorkerStage::READY, 0};
    if (write(status_fd, &ready, sizeof(ready)) != sizeof(ready)) _exit(127);
    char go;
    close(go_w.Get());
    // EOF means the manager gave up on this worker
    if (read(go_r.Get(), &go, 1) != 1) _exit(127);
    execve(program.c_str(), argv.data(), envp.data());
    ChildFail(status_fd, WorkerStage::EXEC);
  }

  pid_ = pid;
  reaped_ = false;
  backend_ = backend;
  owner_uid_ = spec.owner_uid;
  out_w.Reset();
  err_w.Reset();
  status_w.Reset();
  go_r.Reset();
  spdlog::debug("Worker {} forked for {}", pid, program.c_str());

  StageRecord record;
  ssize_t n = ReadRecord(status_r.Get(), record);
  if (n != sizeof(record) || record.stage != WorkerStage::READY) {
    std::string reason = n == sizeof(record) ?
        fmt::format("{}: {}", WorkerStageName(record.stage), strerror(record.err)) :
        std::string("worker exited during setup");
    Abort_();
    throw ManagerError(fmt::format("Failed starting worker: {}", reason));
  }
  // a worker that entered its own user namespace is tracked by it
  ino_t ns = UserNamespace("/proc/" + std::to_string(pid));
  if (ns && ns != UserNamespace("/proc/self")) user_ns_ = ns;
  if (backend && !backend->ApplyLimits(pid, profile)) {
    Abort_();
    throw ManagerError(fmt::format("Failed applying {} limits to worker",
                                   LimitBackendName(backend->Type())));
  }
  char go = 1;
  if (!WriteAll(go_w.Get(), &go, 1)) {
    Abort_();
    throw ManagerError(fmt::format("Failed releasing worker: {}", strerror(errno)));
  }
  go_w.Reset();
  // EOF once execve succeeded and closed the close-on-exec end
  n = ReadRecord(status_r.Get(), record);
  if (n == sizeof(record)) {
    Abort_();
    throw ManagerError(fmt::format("Failed executing {}: {}", program.c_str(), strerror(record.err)));
  }
  if (n < 0) {
    Abort_();
    throw ManagerError(fmt::format("Failed reading worker status: {}", strerror(errno)));
  }
  if (!SetNonBlocking(out_r.Get()) || !SetNonBlocking(err_r.Get())) {
    Abort_();
    throw ManagerError(fmt::format("Failed setting up worker pipes: {}", strerror(errno)));
  }
  out_ = std::move(out_r);
  err_ = std::move(err_r);
}

void Worker::KillAll_() {
  if (backend_) {
    backend_->KillAll(pid_);
  } else if (kill(-pid_, SIGKILL) < 0 && errno != ESRCH) {
    spdlog::warn("Failed killing process group {}: {}", pid_, strerror(errno));
  }
  // setsid() leaves the process group but not the identity or the namespace
  if (owner_uid_ >= 0) {
    KillUser(owner_uid_);
  } else if (user_ns_) {
    KillNamespace_();
  }
}

void Worker::KillNamespace_() {
  for (int round = 0; round < kKillRounds; round++) {
    int killed = 0;
    std::error_code ec;
    for (auto it = fs::directory_iterator("/proc", ec); !ec && it != fs::directory_iterator();
         it.increment(ec)) {
      const std::string name = it->path().filename().string();
      if (name.empty() || name.find_first_not_of("0123456789") != std::string::npos) continue;
      pid_t pid = std::stoi(name);
      if (pid == pid_ || UserNamespace(it->path().string()) != user_ns_) continue;
      if (kill(pid, SIGKILL) == 0) killed++;
    }
    if (ec) {
      spdlog::warn("Failed listing /proc: {}", ec.message());
      return;
    }
    if (!killed) return;
    spdlog::debug("Killed {} processes left in the namespace of worker {}", killed, pid_);
  }
  spdlog::warn("Processes keep appearing in the namespace of worker {}", pid_);
}

int Worker::Reap_(struct rusage* usage) {
  int status = 0;
  while (wait4(pid_, &status, 0, usage) < 0) {
    if (errno == EINTR) continue;
    spdlog::warn("Failed reaping worker {}: {}", pid_, strerror(errno));
    break;
  }
  reaped_ = true;
  if (backend_) {
    memory_exceeded_ = backend_->MemoryExceeded(pid_);
    backend_->Release(pid_);
  }
  return status;
}

void Worker::Abort_() {
  KillAll_();
  struct rusage usage;
  Reap_(&usage);
  out_.Reset();
  err_.Reset();
}

Worker::~Worker() {
  if (pid_ > 0 && !reaped_) Abort_();
}

WorkerOutcome Worker::Wait(long timeout_ms, size_t max_output, long grace_ms,
                           const std::atomic_bool* cancel) {
  WorkerOutcome ret;
  if (pid_ <= 0 || reaped_) throw ManagerError("no running worker");
  struct pollfd fds[2] = {{out_.Get(), POLLIN, 0}, {err_.Get(), POLLIN, 0}};
  std::string* bufs[2] = {&ret.out, &ret.err};
  auto Drain = [&]() {
    for (int i = 0; i < 2; i++) {
      if (fds[i].fd < 0 || !fds[i].revents) continue;
      if (!Collect(fds[i].fd, *bufs[i], max_output, ret.truncated)) fds[i].fd = -1;
    }
  };

  while (true) {
    if (timeout_ms > 0 && MillisecondsSince(start_) >= timeout_ms) {
      ret.timed_out = true;
      break;
    }
    if (cancel && *cancel) {
      ret.cancelled = true;
      break;
    }
    if (poll(fds, 2, kPollIntervalMs) < 0 && errno != EINTR) {
      spdlog::warn("Failed polling worker {}: {}", pid_, strerror(errno));
      break;
    }
    Drain();
    siginfo_t info;
    info.si_pid = 0;
    // leaves the leader a zombie so its process group id stays valid for KillAll_
    if (waitid(P_PID, pid_, &info, WEXITED | WNOHANG | WNOWAIT) < 0 && errno != EINTR) {
      spdlog::warn("Failed waiting for worker {}: {}", pid_, strerror(errno));
      break;
    }
    if (info.si_pid == pid_) break;
  }
  if (ret.timed_out) spdlog::info("Worker {} timed out after {} ms", pid_, timeout_ms);
  if (ret.cancelled) spdlog::info("Worker {} cancelled", pid_);

  // descendants that outlive the leader go with it
  KillAll_();
  ret.wait_status = Reap_(&ret.usage);
  ret.memory_exceeded = memory_exceeded_;
  ret.wall_ms = MillisecondsSince(start_);

  auto grace_end = std::chrono::steady_clock::now() + std::chrono::milliseconds(grace_ms);
  while ((fds[0].fd >= 0 || fds[1].fd >= 0) && std::chrono::steady_clock::now() < grace_end) {
    if (poll(fds, 2, kPollIntervalMs) < 0 && errno != EINTR) break;
    Drain();
  }
  if (fds[0].fd >= 0 || fds[1].fd >= 0) {
    spdlog::warn("Worker {} output still open after kill; abandoned", pid_);
  }
  out_.Reset();
  err_.Reset();
  spdlog::debug("Worker {} reaped, status={:#x}, wall={} ms", pid_, ret.wait_status, ret.wall_ms);
  return ret;
}
