#include <codebox/shell_client.h>

#include <poll.h>
#include <unistd.h>
#include <netdb.h>
#include <sys/un.h>
#include <sys/socket.h>
#include <cerrno>
#include <chrono>
#include <cstring>

#include <spdlog/spdlog.h>

#include "utils.h"

namespace {

std::string Strip(const std::string& str) {
  constexpr char kWhites[] = " \t\r\n";
  size_t start = str.find_first_not_of(kWhites);
  if (start == std::string::npos) return "";
  return str.substr(start, str.find_last_not_of(kWhites) + 1 - start);
}

bool EndsWith(const std::string& str, const char* suffix) {
  size_t len = strlen(suffix);
  return str.size() >= len && str.compare(str.size() - len, len, suffix) == 0;
}

CommandResult TimedOut() {
  CommandResult ret;
  ret.stderr_text = "Command timed out";
  return ret;
}

} // namespace

std::string CommandResult::FormattedOutput() const {
  if (std::string err = Strip(stderr_text); !err.empty()) return "Error:\n```\n" + err + "\n```";
  if (std::string out = Strip(stdout_text); !out.empty()) return "Output:\n```\n" + out + "\n```";
  return "No output";
}

bool ShellClient::Connect(const ListenAddress& address) {
  Close();
  if (address.kind == ListenAddress::Kind::UNIX) {
    fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) goto err;
    struct sockaddr_un addr = {};
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, address.path.c_str(), sizeof(addr.sun_path) - 1);
    if (connect(fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) goto err;
  } else {
    struct addrinfo hints = {}, *res = nullptr;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_NUMERICSERV;
    // a wildcard listen address is reached through loopback
    std::string host = address.host == "0.0.0.0" ? "127.0.0.1" : address.host == "::" ? "::1" : address.host;
    std::string port = std::to_string(address.port);
    if (int ret = getaddrinfo(host.c_str(), port.c_str(), &hints, &res)) {
      spdlog::warn("Failed resolving {}: {}", host, gai_strerror(ret));
      return false;
    }
    bool ok = false;
    for (auto it = res; it && !ok; it = it->ai_next) {
      fd_ = socket(it->ai_family, it->ai_socktype | SOCK_CLOEXEC, it->ai_protocol);
      if (fd_ < 0) continue;
      ok = connect(fd_, it->ai_addr, it->ai_addrlen) == 0;
      if (!ok) Close();
    }
    freeaddrinfo(res);
    if (!ok) goto err;
  }
  at_prompt_ = false;
  pending_.clear();
  spdlog::debug("Connected to shell at {}", address.ToString());
  return true;
err:
  spdlog::warn("Failed connecting to {}: {}", address.ToString(), strerror(errno));
  Close();
  return false;
}

void ShellClient::Close() {
  if (fd_ >= 0) close(fd_);
  fd_ = -1;
  at_prompt_ = false;
}

bool ShellClient::ReadUntilPrompt_(std::string& output, long timeout_ms) {
  auto end = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  char buf[4096];
  while (true) {
    size_t line_end = pending_.rfind('\n');
    std::string tail = line_end == std::string::npos ? pending_ : pending_.substr(line_end + 1);
    if (EndsWith(tail, kPromptMarker)) {
      output = line_end == std::string::npos ? "" : pending_.substr(0, line_end + 1);
      pending_.clear();
      at_prompt_ = true;
      return true;
    }
    long remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        end - std::chrono::steady_clock::now()).count();
    if (remaining <= 0) return false;
    struct pollfd pfd = {fd_, POLLIN, 0};
    int ret = poll(&pfd, 1, remaining);
    if (ret < 0 && errno != EINTR) return false;
    if (ret <= 0) continue;
    ssize_t n = read(fd_, buf, sizeof(buf));
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) {
      // the shell went away; whatever arrived is the output
      output = std::move(pending_);
      pending_.clear();
      Close();
      return true;
    }
    for (ssize_t i = 0; i < n; i++) {
      if (buf[i] != '\r') pending_.push_back(buf[i]);
    }
  }
}

CommandResult ShellClient::RunCommand(const std::string& command, int timeout_seconds,
                                      long prompt_timeout_ms) {
  CommandResult ret;
  if (fd_ < 0) {
    ret.stderr_text = "Not connected";
    return ret;
  }
  if (!at_prompt_) {
    std::string banner;
    if (!ReadUntilPrompt_(banner, prompt_timeout_ms)) return TimedOut();
    if (fd_ < 0) {
      ret.stderr_text = "Shell closed the connection";
      return ret;
    }
  }
  std::string line = command + "\n";
  if (!WriteAll(fd_, line.data(), line.size())) {
    ret.stderr_text = std::string("Failed sending command: ") + strerror(errno);
    Close();
    return ret;
  }
  at_prompt_ = false;
  if (!ReadUntilPrompt_(ret.stdout_text, timeout_seconds * 1000L)) return TimedOut();
  return ret;
}
