#include <codebox/workspace.h>

#include <cerrno>
#include <cstring>
#include <cstdlib>

#include <spdlog/spdlog.h>

#include <codebox/paths.h>
#include "utils.h"

ScopedWorkspace::ScopedWorkspace(ScopedWorkspace&& x) noexcept : path_(std::move(x.path_)) {
  x.path_.clear();
}

ScopedWorkspace& ScopedWorkspace::operator=(ScopedWorkspace&& x) noexcept {
  if (this != &x) {
    Release();
    path_ = std::move(x.path_);
    x.path_.clear();
  }
  return *this;
}

bool ScopedWorkspace::Acquire(const fs::path& root) {
  Release();
  fs::path base = root.empty() ? DefaultWorkspaceRoot() : root;
  std::error_code ec;
  // workers running under another identity must be able to traverse it
  constexpr fs::perms kPerm711 = fs::perms::owner_all | fs::perms::group_exec | fs::perms::others_exec;
  if (!fs::is_directory(base, ec) && !CreateDirs(base, kPerm711)) return false;
  std::string tmpl = (base / "codebox-XXXXXX").string();
  // mkdtemp creates the directory with mode 0700
  if (!mkdtemp(tmpl.data())) {
    spdlog::warn("Failed creating workspace under {}: {}", base.c_str(), strerror(errno));
    return false;
  }
  path_ = tmpl;
  spdlog::debug("Acquired workspace {}", path_.c_str());
  return true;
}

void ScopedWorkspace::Release() noexcept {
  if (path_.empty()) return;
  try {
    RemoveAll(path_);
  } catch (std::exception& e) {
    // RemoveAll logs filesystem errors itself; this only sees allocation failures
    spdlog::warn("Failed releasing workspace {}: {}", path_.c_str(), e.what());
  }
  path_.clear();
}
