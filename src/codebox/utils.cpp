#include "utils.h"

#include <fcntl.h>
#include <dirent.h>
#include <signal.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/socket.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;

#define X(...) X_RETURN_ARG2(LimitBackendType, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LimitBackendName, LimitBackendType, ENUM_LIMIT_BACKEND_)
#undef X

#define X(...) X_RETURN_ARG2(ExitKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ExitKindName, ExitKind, ENUM_EXIT_KIND_)
#undef X

#define X(...) X_RETURN_ARG1(ExecutionMode, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ExecutionModeName, ExecutionMode, ENUM_EXECUTION_MODE_)
#undef X

#define X(...) X_RETURN_ARG1(SessionState, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* SessionStateName, SessionState, ENUM_SESSION_STATE_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG2

static const char* kLimitBackendTable[] = {
#define X(name, confname) confname,
  ENUM_LIMIT_BACKEND_
#undef X
};

std::optional<LimitBackendType> GetLimitBackend(const std::string& str) {
  for (size_t i = 0; i < sizeof(kLimitBackendTable) / sizeof(kLimitBackendTable[0]); i++) {
    if (str == kLimitBackendTable[i]) return (LimitBackendType)i;
  }
  return std::nullopt;
}

static const char* kExitKindTable[] = {
#define X(name, repr) repr,
  ENUM_EXIT_KIND_
#undef X
};

std::optional<ExitKind> GetExitKind(const std::string& str) {
  for (size_t i = 0; i < sizeof(kExitKindTable) / sizeof(kExitKindTable[0]); i++) {
    if (str == kExitKindTable[i]) return (ExitKind)i;
  }
  return std::nullopt;
}

std::string SignalName(int signal) {
  switch (signal) {
#define SIGNAL_CASE(x) case x: return #x;
    SIGNAL_CASE(SIGHUP)
    SIGNAL_CASE(SIGINT)
    SIGNAL_CASE(SIGQUIT)
    SIGNAL_CASE(SIGILL)
    SIGNAL_CASE(SIGTRAP)
    SIGNAL_CASE(SIGABRT)
    SIGNAL_CASE(SIGBUS)
    SIGNAL_CASE(SIGFPE)
    SIGNAL_CASE(SIGKILL)
    SIGNAL_CASE(SIGUSR1)
    SIGNAL_CASE(SIGSEGV)
    SIGNAL_CASE(SIGUSR2)
    SIGNAL_CASE(SIGPIPE)
    SIGNAL_CASE(SIGALRM)
    SIGNAL_CASE(SIGTERM)
    SIGNAL_CASE(SIGCHLD)
    SIGNAL_CASE(SIGSYS)
    SIGNAL_CASE(SIGXCPU)
    SIGNAL_CASE(SIGXFSZ)
#undef SIGNAL_CASE
  }
  return "signal " + std::to_string(signal);
}

void UniqueFd::Reset(int fd) {
  if (fd_ >= 0) close(fd_);
  fd_ = fd;
}

bool MakePipe(UniqueFd& read_end, UniqueFd& write_end) {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) < 0) return false;
  read_end.Reset(fds[0]);
  write_end.Reset(fds[1]);
  return true;
}

bool SetNonBlocking(int fd) {
  int flags = fcntl(fd, F_GETFL);
  if (flags < 0) return false;
  return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

bool WriteAll(int fd, const char* buf, size_t len) {
  struct stat st;
  bool is_socket = fstat(fd, &st) == 0 && S_ISSOCK(st.st_mode);
  while (len) {
    ssize_t n = is_socket ? send(fd, buf, len, MSG_NOSIGNAL) : write(fd, buf, len);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    buf += n;
    len -= n;
  }
  return true;
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), ec.message());
  return false;
}

namespace {

// Adds owner rwx to name (relative to dir_fd) and every directory below it.
// Symlinks are never followed.
void RestoreOwnerAccess(int dir_fd, const char* name) {
  struct stat st;
  if (fstatat(dir_fd, name, &st, AT_SYMLINK_NOFOLLOW) < 0 || !S_ISDIR(st.st_mode)) return;
  if ((st.st_mode & S_IRWXU) != S_IRWXU) {
    IGNORE_RETURN(fchmodat(dir_fd, name, (st.st_mode & 07777) | S_IRWXU, 0));
  }
  int fd = openat(dir_fd, name, O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC);
  if (fd < 0) return;
  DIR* dir = fdopendir(fd);
  if (!dir) {
    close(fd);
    return;
  }
  while (struct dirent* entry = readdir(dir)) {
    if (!strcmp(entry->d_name, ".") || !strcmp(entry->d_name, "..")) continue;
    if (entry->d_type != DT_DIR && entry->d_type != DT_UNKNOWN) continue;
    RestoreOwnerAccess(fd, entry->d_name);
  }
  closedir(dir);
}

} // namespace

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec == std::errc::permission_denied) {
    // the tree may hold directories its owner made inaccessible
    RestoreOwnerAccess(AT_FDCWD, path.c_str());
    ec.clear();
    fs::remove_all(path, ec);
  }
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
  return false;
}

bool WriteFile(const fs::path& path, const std::string& content, fs::perms perms) {
  std::error_code ec;
  {
    std::ofstream fout(path, std::ios::binary | std::ios::trunc);
    if (!fout || !fout.write(content.data(), content.size())) {
      spdlog::warn("Failed writing {}", path.c_str());
      return false;
    }
  }
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) {
    spdlog::warn("Failed setting permissions of {}: {}", path.c_str(), ec.message());
    return false;
  }
  return true;
}

bool WriteControl(const fs::path& path, const std::string& value) {
  int fd = open(path.c_str(), O_WRONLY | O_CLOEXEC);
  if (fd < 0) goto err;
  if (write(fd, value.data(), value.size()) != (ssize_t)value.size()) {
    int saved = errno;
    close(fd);
    errno = saved;
    goto err;
  }
  close(fd);
  return true;
err:
  spdlog::warn("Failed writing {} to {}: {}", value, path.c_str(), strerror(errno));
  return false;
}

bool ChownTree(const fs::path& path, int uid, int gid) {
  std::error_code ec;
  if (lchown(path.c_str(), uid, gid) < 0) goto err;
  if (fs::is_directory(path, ec)) {
    for (auto& entry : fs::recursive_directory_iterator(path, ec)) {
      if (lchown(entry.path().c_str(), uid, gid) < 0) goto err;
    }
    if (ec) {
      spdlog::warn("Failed listing {}: {}", path.c_str(), ec.message());
      return false;
    }
  }
  return true;
err:
  spdlog::warn("Failed changing owner of {}: {}", path.c_str(), strerror(errno));
  return false;
}

std::vector<std::string> SplitWords(const std::string& str) {
  std::vector<std::string> ret;
  std::istringstream in(str);
  for (std::string word; in >> word;) ret.push_back(std::move(word));
  return ret;
}

std::vector<std::string> SplitList(const std::string& str, char sep) {
  std::vector<std::string> ret;
  constexpr char kWhites[] = " \t\r\n";
  size_t start = 0;
  while (start <= str.size()) {
    size_t end = str.find(sep, start);
    if (end == std::string::npos) end = str.size();
    std::string item = str.substr(start, end - start);
    item.erase(0, item.find_first_not_of(kWhites));
    // std::string::npos + 1 == 0
    item.erase(item.find_last_not_of(kWhites) + 1);
    if (!item.empty()) ret.push_back(std::move(item));
    start = end + 1;
  }
  return ret;
}

fs::path FindExecutable(const std::string& name, const std::string& search_path) {
  if (name.empty()) return {};
  if (name.find('/') != std::string::npos) {
    return access(name.c_str(), X_OK) == 0 ? fs::path(name) : fs::path();
  }
  for (auto& dir : SplitList(search_path, ':')) {
    fs::path candidate = fs::path(dir) / name;
    std::error_code ec;
    if (fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0) {
      return candidate;
    }
  }
  return {};
}
