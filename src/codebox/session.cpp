#include <codebox/session.h>

#include <fcntl.h>
#include <poll.h>
#include <pty.h>
#include <utmp.h>
#include <signal.h>
#include <unistd.h>
#include <termios.h>
#include <netdb.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/un.h>
#include <sys/wait.h>
#include <sys/socket.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

#include <spdlog/spdlog.h>

#include <codebox/utils.h>
#include <codebox/execution.h>
#include <codebox/workspace.h>
#include "utils.h"

namespace {

constexpr char kDefaultShell[] = "/bin/bash --norc --noprofile --noediting -i";
constexpr char kDefaultPrompt[] = "(sandbox) \\u@\\h:\\w$ ";
constexpr long kDefaultSessionGraceMs = 1000;
constexpr int kListenBacklog = 64;
constexpr size_t kProxyBufferSize = 16384;

// written by the signal handler; the listener's wake pipe
int signal_fd = -1;

void WakeHandler(int sig) {
  int saved = errno;
  char c = (char)sig;
  if (signal_fd >= 0) IGNORE_RETURN(write(signal_fd, &c, 1));
  errno = saved;
}

bool InstallHandlers(bool install) {
  struct sigaction action = {};
  action.sa_handler = install ? WakeHandler : SIG_DFL;
  action.sa_flags = SA_RESTART;
  sigemptyset(&action.sa_mask);
  for (int sig : {SIGTERM, SIGINT, SIGHUP, SIGCHLD}) {
    if (sigaction(sig, &action, nullptr) < 0) return false;
  }
  return true;
}

bool WaitPid(pid_t pid, long timeout_ms) {
  auto end = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (true) {
    pid_t ret = waitpid(pid, nullptr, WNOHANG);
    if (ret == pid || (ret < 0 && errno == ECHILD)) return true;
    if (std::chrono::steady_clock::now() >= end) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}

void Teardown(pid_t shell_pid, int master_fd, int conn_fd, long grace_ms, ScopedWorkspace& workspace) {
  spdlog::debug("Session {}: {}", getpid(), SessionStateName(SessionState::TERMINATING));
  kill(-shell_pid, SIGHUP);
  kill(-shell_pid, SIGCONT);
  if (master_fd >= 0) close(master_fd);
  if (!WaitPid(shell_pid, grace_ms)) {
    kill(-shell_pid, SIGKILL);
    if (!WaitPid(shell_pid, grace_ms)) spdlog::warn("Shell {} did not exit", shell_pid);
  } else {
    // stray jobs left in the shell's group
    kill(-shell_pid, SIGKILL);
  }
  shutdown(conn_fd, SHUT_RDWR);
  close(conn_fd);
  workspace.Release();
}

volatile sig_atomic_t session_terminating = 0;

void TerminateHandler(int) {
  session_terminating = 1;
}

// false on a hard error
bool Flush(int fd, std::string& pending, bool is_socket) {
  while (!pending.empty()) {
    ssize_t n = is_socket ? send(fd, pending.data(), pending.size(), MSG_NOSIGNAL) :
                            write(fd, pending.data(), pending.size());
    if (n < 0) {
      if (errno == EINTR) continue;
      return errno == EAGAIN;
    }
    pending.erase(0, n);
  }
  return true;
}

// Moves bytes between the connection and the pty until either side closes or a
// termination signal arrives. wait_mask is the signal mask to use while blocked.
void Proxy(int conn_fd, int master_fd, const sigset_t* wait_mask) {
  std::string to_shell, to_conn;
  char buf[kProxyBufferSize];
  while (!session_terminating) {
    struct pollfd fds[2] = {
      {conn_fd, (short)(to_conn.empty() ? POLLIN : POLLIN | POLLOUT), 0},
      {master_fd, (short)(to_shell.empty() ? POLLIN : POLLIN | POLLOUT), 0},
    };
    // stop reading a side while its peer is still behind
    if (to_shell.size() >= kProxyBufferSize) fds[0].events &= ~POLLIN;
    if (to_conn.size() >= kProxyBufferSize) fds[1].events &= ~POLLIN;
    if (ppoll(fds, 2, nullptr, wait_mask) < 0) {
      if (errno == EINTR) continue;
      spdlog::warn("Session poll failed: {}", strerror(errno));
      return;
    }
    if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
      ssize_t n = read(conn_fd, buf, sizeof(buf));
      if (n == 0 || (n < 0 && errno != EAGAIN && errno != EINTR)) return;
      if (n > 0) to_shell.append(buf, n);
    }
    if (fds[1].revents & (POLLIN | POLLHUP | POLLERR)) {
      ssize_t n = read(master_fd, buf, sizeof(buf));
      // EIO once the last holder of the slave side is gone
      if (n == 0 || (n < 0 && errno != EAGAIN && errno != EINTR)) {
        IGNORE_RETURN(Flush(conn_fd, to_conn, true));
        return;
      }
      if (n > 0) to_conn.append(buf, n);
    }
    if (!Flush(conn_fd, to_conn, true) || !Flush(master_fd, to_shell, false)) return;
  }
}

} // namespace

std::optional<ListenAddress> ListenAddress::Parse(const std::string& str) {
  ListenAddress ret;
  if (str.compare(0, 5, "unix:") == 0) {
    ret.kind = Kind::UNIX;
    ret.path = str.substr(5);
    // unix:///run/x.sock
    if (ret.path.compare(0, 2, "//") == 0) ret.path.erase(0, 2);
    if (ret.path.empty() || ret.path.size() >= sizeof(sockaddr_un::sun_path)) return std::nullopt;
    return ret;
  }
  std::string rest = str.compare(0, 6, "tcp://") == 0 ? str.substr(6) : str;
  size_t colon = rest.rfind(':');
  if (colon == std::string::npos || colon + 1 == rest.size()) return std::nullopt;
  ret.kind = Kind::TCP;
  ret.host = rest.substr(0, colon);
  if (ret.host.size() >= 2 && ret.host.front() == '[' && ret.host.back() == ']') {
    ret.host = ret.host.substr(1, ret.host.size() - 2);
  }
  if (ret.host.empty()) ret.host = "0.0.0.0";
  std::string port = rest.substr(colon + 1);
  if (port.find_first_not_of("0123456789") != std::string::npos || port.size() > 5) return std::nullopt;
  ret.port = std::stoi(port);
  if (ret.port > 65535) return std::nullopt;
  return ret;
}

std::string ListenAddress::ToString() const {
  if (kind == Kind::UNIX) return "unix:" + path;
  if (host.find(':') != std::string::npos) return "tcp://[" + host + "]:" + std::to_string(port);
  return "tcp://" + host + ":" + std::to_string(port);
}

SessionOptions::SessionOptions() :
    shell(SplitWords(kDefaultShell)),
    prompt(kDefaultPrompt),
    env_allow(DefaultEnvAllowList()),
    grace_ms(kDefaultSessionGraceMs) {}

SessionListener::SessionListener(ListenAddress address, SessionOptions options) :
    address_(std::move(address)), options_(std::move(options)),
    listen_fd_(-1), wake_fd_{-1, -1}, session_count_(0) {}

SessionListener::~SessionListener() {
  if (listen_fd_ >= 0) {
    close(listen_fd_);
    if (address_.kind == ListenAddress::Kind::UNIX) unlink(address_.path.c_str());
  }
  for (int fd : wake_fd_) {
    if (fd >= 0) close(fd);
  }
}

bool SessionListener::Bind() {
  if (pipe2(wake_fd_, O_CLOEXEC | O_NONBLOCK) < 0) {
    spdlog::error("Failed creating wake pipe: {}", strerror(errno));
    return false;
  }
  if (address_.kind == ListenAddress::Kind::UNIX) {
    listen_fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (listen_fd_ < 0) goto err;
    struct sockaddr_un addr = {};
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, address_.path.c_str(), sizeof(addr.sun_path) - 1);
    // stale socket from an earlier run
    if (unlink(address_.path.c_str()) < 0 && errno != ENOENT) goto err;
    if (bind(listen_fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) goto err;
  } else {
    struct addrinfo hints = {}, *res = nullptr;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;
    std::string port = std::to_string(address_.port);
    if (int ret = getaddrinfo(address_.host.c_str(), port.c_str(), &hints, &res)) {
      spdlog::error("Failed resolving {}: {}", address_.host, gai_strerror(ret));
      return false;
    }
    listen_fd_ = socket(res->ai_family, res->ai_socktype | SOCK_CLOEXEC, res->ai_protocol);
    int one = 1;
    bool ok = listen_fd_ >= 0 &&
        setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) == 0 &&
        bind(listen_fd_, res->ai_addr, res->ai_addrlen) == 0;
    freeaddrinfo(res);
    if (!ok) goto err;
    if (address_.port == 0) {
      struct sockaddr_storage bound = {};
      socklen_t len = sizeof(bound);
      if (getsockname(listen_fd_, (struct sockaddr*)&bound, &len) < 0) goto err;
      address_.port = ntohs(bound.ss_family == AF_INET6 ?
                            ((struct sockaddr_in6*)&bound)->sin6_port :
                            ((struct sockaddr_in*)&bound)->sin_port);
    }
  }
  if (listen(listen_fd_, kListenBacklog) < 0) goto err;
  spdlog::info("Listening on {}", address_.ToString());
  return true;
err:
  spdlog::error("Failed listening on {}: {}", address_.ToString(), strerror(errno));
  if (listen_fd_ >= 0) close(listen_fd_);
  listen_fd_ = -1;
  return false;
}

void SessionListener::Stop() {
  char c = 0;
  if (wake_fd_[1] >= 0) IGNORE_RETURN(write(wake_fd_[1], &c, 1));
}

void SessionListener::Accept_() {
  int conn_fd = accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
  if (conn_fd < 0) {
    if (errno != EAGAIN && errno != EINTR && errno != ECONNABORTED) {
      spdlog::warn("Failed accepting connection: {}", strerror(errno));
    }
    return;
  }
  pid_t pid = fork();
  if (pid < 0) {
    spdlog::warn("Failed forking session: {}", strerror(errno));
    close(conn_fd);
    return;
  }
  if (pid == 0) {
    setpgid(0, 0);
    signal_fd = -1;
    InstallHandlers(false);
    close(listen_fd_);
    close(wake_fd_[0]);
    close(wake_fd_[1]);
    _exit(RunSession(conn_fd, options_));
  }
  // either side may win; both agree on the group
  setpgid(pid, pid);
  close(conn_fd);
  sessions_.insert(pid);
  session_count_ = sessions_.size();
  spdlog::info("Session {} started, {} live", pid, sessions_.size());
}

void SessionListener::Reap_() {
  for (auto it = sessions_.begin(); it != sessions_.end();) {
    int status;
    pid_t ret = waitpid(*it, &status, WNOHANG);
    if (ret == *it || (ret < 0 && errno == ECHILD)) {
      spdlog::info("Session {} ended", *it);
      // whatever the session left behind in its group
      kill(-*it, SIGKILL);
      it = sessions_.erase(it);
    } else {
      ++it;
    }
  }
  session_count_ = sessions_.size();
}

void SessionListener::TerminateSessions_() {
  if (sessions_.empty()) return;
  spdlog::info("Terminating {} sessions", sessions_.size());
  for (pid_t pid : sessions_) kill(-pid, SIGTERM);
  auto end = std::chrono::steady_clock::now() + std::chrono::milliseconds(options_.grace_ms);
  while (!sessions_.empty() && std::chrono::steady_clock::now() < end) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    Reap_();
  }
  for (pid_t pid : sessions_) {
    spdlog::warn("Session {} ignored SIGTERM, killing", pid);
    kill(-pid, SIGKILL);
    while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR);
  }
  sessions_.clear();
  session_count_ = 0;
}

void SessionListener::Serve() {
  if (listen_fd_ < 0) {
    spdlog::error("Serve() called before a successful Bind()");
    return;
  }
  signal_fd = wake_fd_[1];
  if (!InstallHandlers(true)) spdlog::warn("Failed installing signal handlers: {}", strerror(errno));
  bool running = true;
  while (running) {
    struct pollfd fds[2] = {{listen_fd_, POLLIN, 0}, {wake_fd_[0], POLLIN, 0}};
    if (poll(fds, 2, -1) < 0) {
      if (errno == EINTR) continue;
      spdlog::error("Listener poll failed: {}", strerror(errno));
      break;
    }
    if (fds[1].revents & POLLIN) {
      char sigs[64];
      ssize_t n;
      while ((n = read(wake_fd_[0], sigs, sizeof(sigs))) > 0) {
        for (ssize_t i = 0; i < n; i++) {
          // 0 is Stop()
          if (sigs[i] != SIGCHLD) {
            if (sigs[i]) spdlog::info("Received {}", SignalName(sigs[i]));
            running = false;
          }
        }
      }
      Reap_();
    }
    if (running && (fds[0].revents & POLLIN)) Accept_();
  }
  TerminateSessions_();
  InstallHandlers(false);
  signal_fd = -1;
  spdlog::info("Listener on {} stopped", address_.ToString());
}

int RunSession(int conn_fd, const SessionOptions& options) {
  spdlog::debug("Session {}: {}", getpid(), SessionStateName(SessionState::CONNECTING));
  // SIGTERM from the listener stays pending until the proxy waits, so teardown always runs
  sigset_t block, wait_mask;
  sigemptyset(&block);
  sigaddset(&block, SIGTERM);
  sigprocmask(SIG_BLOCK, &block, &wait_mask);
  sigdelset(&wait_mask, SIGTERM);
  struct sigaction action = {};
  action.sa_handler = TerminateHandler;
  sigemptyset(&action.sa_mask);
  sigaction(SIGTERM, &action, nullptr);

  if (options.shell.empty()) {
    close(conn_fd);
    return 1;
  }
  ScopedWorkspace workspace;
  if (!workspace.Acquire(options.workspace_root)) {
    close(conn_fd);
    return 1;
  }
  std::vector<std::string> envs = GuestEnvironment(options.env_allow, workspace.path());
  envs.push_back("PS1=" + options.prompt);
  envs.push_back("TERM=dumb");
  std::string search_path;
  for (auto& i : envs) {
    if (i.compare(0, 5, "PATH=") == 0) search_path = i.substr(5);
  }
  fs::path program = FindExecutable(options.shell[0], search_path);
  if (program.empty()) {
    spdlog::warn("Shell {} not found", options.shell[0]);
    close(conn_fd);
    return 1;
  }
  std::vector<char*> argv, envp;
  for (auto& i : options.shell) argv.push_back(const_cast<char*>(i.c_str()));
  argv.push_back(nullptr);
  for (auto& i : envs) envp.push_back(const_cast<char*>(i.c_str()));
  envp.push_back(nullptr);
  const char* workdir = workspace.path().c_str();

  int master_fd, slave_fd;
  if (openpty(&master_fd, &slave_fd, nullptr, nullptr, nullptr) < 0) {
    spdlog::warn("Failed opening pseudo-terminal: {}", strerror(errno));
    close(conn_fd);
    return 1;
  }
  struct termios tio;
  if (tcgetattr(slave_fd, &tio) == 0) {
    tio.c_lflag &= ~(ECHO | ECHOE | ECHOK | ECHONL);
    if (tcsetattr(slave_fd, TCSANOW, &tio) < 0) spdlog::warn("Failed disabling echo: {}", strerror(errno));
  }
  pid_t shell_pid = fork();
  if (shell_pid < 0) {
    spdlog::warn("Failed forking shell: {}", strerror(errno));
    close(master_fd);
    close(slave_fd);
    close(conn_fd);
    return 1;
  }
  if (shell_pid == 0) {
    close(master_fd);
    close(conn_fd);
    sigprocmask(SIG_SETMASK, &wait_mask, nullptr);
    // new session with the pty as controlling terminal and stdio
    if (login_tty(slave_fd) < 0) _exit(127);
    if (chdir(workdir) < 0) _exit(127);
    execve(program.c_str(), argv.data(), envp.data());
    _exit(127);
  }
  close(slave_fd);
  fcntl(master_fd, F_SETFD, FD_CLOEXEC);
  if (!SetNonBlocking(master_fd) || !SetNonBlocking(conn_fd)) {
    spdlog::warn("Failed setting up session descriptors: {}", strerror(errno));
    Teardown(shell_pid, master_fd, conn_fd, options.grace_ms, workspace);
    return 1;
  }

  spdlog::debug("Session {}: {}, shell {} in {}", getpid(), SessionStateName(SessionState::ACTIVE),
                shell_pid, workdir);
  Proxy(conn_fd, master_fd, &wait_mask);
  Teardown(shell_pid, master_fd, conn_fd, options.grace_ms, workspace);
  return 0;
}
