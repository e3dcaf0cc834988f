#ifndef CODEBOX_UTILS_H_
#define CODEBOX_UTILS_H_

#include <string>
#include <vector>
#include <filesystem>

#include <codebox/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

constexpr fs::perms kPerm644 =
    fs::perms::owner_read | fs::perms::owner_write |
    fs::perms::group_read | fs::perms::others_read;

// Owns a file descriptor.
class UniqueFd {
  int fd_;
 public:
  explicit UniqueFd(int fd = -1) : fd_(fd) {}
  ~UniqueFd() { Reset(); }
  UniqueFd(UniqueFd&& x) noexcept : fd_(x.Release()) {}
  UniqueFd& operator=(UniqueFd&& x) noexcept {
    if (this != &x) Reset(x.Release());
    return *this;
  }
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;

  int Get() const { return fd_; }
  int Release() {
    int ret = fd_;
    fd_ = -1;
    return ret;
  }
  void Reset(int fd = -1);
  explicit operator bool() const { return fd_ >= 0; }
};

// Both ends are close-on-exec.
bool MakePipe(UniqueFd& read_end, UniqueFd& write_end);
bool SetNonBlocking(int fd);
// Retries on EINTR and short writes; uses MSG_NOSIGNAL on sockets.
bool WriteAll(int fd, const char* buf, size_t len);

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
// Directories that deny their owner access are opened up and the removal retried.
bool RemoveAll(const fs::path&);
bool WriteFile(const fs::path&, const std::string& content, fs::perms = fs::perms::unknown);
// Writes a single value into a kernel control file (cgroupfs).
bool WriteControl(const fs::path&, const std::string& value);
bool ChownTree(const fs::path&, int uid, int gid);

std::vector<std::string> SplitWords(const std::string&);
std::vector<std::string> SplitList(const std::string&, char sep);

// Resolves name against the colon-separated search_path unless it contains a slash.
// Returns an empty path if no executable is found.
fs::path FindExecutable(const std::string& name, const std::string& search_path);

#endif  // CODEBOX_UTILS_H_
