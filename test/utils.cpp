#include "utils.h"

#include <unistd.h>
#include <chrono>
#include <thread>
#include <fstream>

fs::path TestWorkspaceRoot() {
  return fs::temp_directory_path() / ("codebox-test-" + std::to_string(getpid()));
}

ExecutionOptions ShellOptions() {
  ExecutionOptions options;
  options.workspace_root = TestWorkspaceRoot();
  options.interpreter = {"/bin/sh"};
  options.grace_ms = 500;
  return options;
}

ResourceLimitProfile SmallProfile() {
  ResourceLimitProfile profile;
  profile.max_address_space_bytes = 256L * 1024 * 1024;
  profile.max_cpu_seconds = 5;
  profile.max_processes = 32;
  profile.max_output_bytes = 64 * 1024;
  return profile;
}

bool HasExecutable(const std::string& path) {
  return access(path.c_str(), X_OK) == 0;
}

fs::path WriteScript(const fs::path& dir, const std::string& name, const std::string& body) {
  fs::create_directories(dir);
  fs::path path = dir / name;
  {
    std::ofstream fout(path);
    fout << "#!/bin/sh\n" << body;
  }
  fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                        fs::perms::others_read | fs::perms::others_exec);
  return path;
}

size_t CountEntries(const fs::path& dir, const std::string& prefix) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) return 0;
  size_t ret = 0;
  for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
    if (it->path().filename().string().compare(0, prefix.size(), prefix) == 0) ret++;
  }
  return ret;
}

bool ProcessAlive(pid_t pid) {
  // zombies are dead for our purposes; init may not have reaped them yet
  std::ifstream fin("/proc/" + std::to_string(pid) + "/stat");
  std::string stat;
  if (!std::getline(fin, stat)) return false;
  size_t pos = stat.rfind(')');
  if (pos == std::string::npos || pos + 2 >= stat.size()) return false;
  char state = stat[pos + 2];
  return state != 'Z' && state != 'X';
}

bool ExitsWithin(pid_t pid, long timeout_ms) {
  auto end = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (ProcessAlive(pid)) {
    if (std::chrono::steady_clock::now() >= end) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  return true;
}
