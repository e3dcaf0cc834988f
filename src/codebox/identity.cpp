#include "identity.h"

#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>

#include <spdlog/spdlog.h>

namespace {

constexpr int kKillRounds = 20;

} // namespace

IdentityPool::IdentityPool(int base, int count) {
  // handed out from the back, lowest uid first
  for (int i = count - 1; i >= 0; i--) free_.push_back(base + i);
}

IdentityPool::Lease IdentityPool::Take() {
  Lease ret;
  std::lock_guard<std::mutex> lck(mutex_);
  if (free_.empty()) return ret;
  ret.pool_ = this;
  ret.uid_ = free_.back();
  free_.pop_back();
  return ret;
}

size_t IdentityPool::Available() {
  std::lock_guard<std::mutex> lck(mutex_);
  return free_.size();
}

void IdentityPool::Return_(int uid) {
  std::lock_guard<std::mutex> lck(mutex_);
  free_.push_back(uid);
}

IdentityPool::Lease& IdentityPool::Lease::operator=(Lease&& x) noexcept {
  if (this != &x) {
    Reset();
    pool_ = x.pool_;
    uid_ = x.uid_;
    x.pool_ = nullptr;
    x.uid_ = -1;
  }
  return *this;
}

void IdentityPool::Lease::Reset() {
  if (pool_ && uid_ >= 0) pool_->Return_(uid_);
  pool_ = nullptr;
  uid_ = -1;
}

void KillUser(int uid) {
  if (uid < 0 || (uid_t)uid == getuid()) return;
  pid_t pid = fork();
  if (pid < 0) {
    spdlog::warn("Failed forking to kill processes of uid {}: {}", uid, strerror(errno));
    return;
  }
  if (pid == 0) {
    // kill(-1) reaches exactly the processes this uid may signal; it skips the caller
    if (setuid(uid) < 0) _exit(1);
    for (int i = 0; i < kKillRounds; i++) {
      // ESRCH once nothing is left; repeated to catch forks racing the first sweep
      if (kill(-1, SIGKILL) < 0) _exit(0);
      usleep(1000);
    }
    _exit(0);
  }
  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno == EINTR) continue;
    spdlog::warn("Failed waiting for killer of uid {}: {}", uid, strerror(errno));
    return;
  }
  if (!WIFEXITED(status) || WEXITSTATUS(status)) {
    spdlog::warn("Failed killing processes of uid {}", uid);
  }
}
