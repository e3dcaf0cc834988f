#ifndef INCLUDE_CODEBOX_SESSION_H_
#define INCLUDE_CODEBOX_SESSION_H_

#include <atomic>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <unordered_set>

#include <sys/types.h>

#define ENUM_SESSION_STATE_ \
  X(CONNECTING) \
  X(ACTIVE) \
  X(TERMINATING)
enum class SessionState {
#define X(name) name,
  ENUM_SESSION_STATE_
#undef X
};

class ListenAddress {
 public:
  enum class Kind { TCP, UNIX };
  Kind kind;
  std::string host; // TCP
  int port;         // TCP; 0 picks a free port
  std::string path; // UNIX

  ListenAddress() : kind(Kind::TCP), port(0) {}

  // "tcp://host:port", "host:port" or "unix:/path"
  static std::optional<ListenAddress> Parse(const std::string&);
  std::string ToString() const;
};

class SessionOptions {
 public:
  std::vector<std::string> shell;
  std::string prompt; // exported as PS1
  std::vector<std::string> env_allow;
  // each session's shell starts in its own workspace under this; empty = system temp directory
  std::filesystem::path workspace_root;
  long grace_ms; // between hangup and kill on teardown

  SessionOptions();
};

// Accepts connections and forks one session process per connection. Each session process
// is the leader of its own process group and owns one shell on one pseudo-terminal.
// Only the listening socket is shared.
class SessionListener {
 public:
  SessionListener(ListenAddress address, SessionOptions options);
  ~SessionListener();
  SessionListener(const SessionListener&) = delete;
  SessionListener& operator=(const SessionListener&) = delete;

  bool Bind();
  // Returns after Stop() or SIGTERM/SIGINT/SIGHUP, once every session has been torn down.
  // Installs process-wide signal handlers while running.
  void Serve();
  // Callable from any thread.
  void Stop();

  // Resolved address; the actual port if port 0 was requested.
  const ListenAddress& address() const { return address_; }
  size_t session_count() const { return session_count_; }

 private:
  void Accept_();
  void Reap_();
  void TerminateSessions_();

  ListenAddress address_;
  const SessionOptions options_;
  int listen_fd_;
  int wake_fd_[2];
  std::unordered_set<pid_t> sessions_;
  std::atomic<size_t> session_count_;
};

// Runs a session on an accepted connection in the calling process:
// Connecting (spawn the shell in a fresh workspace) -> Active (proxy bytes) ->
// Terminating (hang up, reap, close, remove the workspace).
// Returns the process exit code.
int RunSession(int conn_fd, const SessionOptions& options);

#endif  // INCLUDE_CODEBOX_SESSION_H_
