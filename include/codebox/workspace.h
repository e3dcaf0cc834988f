#ifndef INCLUDE_CODEBOX_WORKSPACE_H_
#define INCLUDE_CODEBOX_WORKSPACE_H_

#include <string>
#include <filesystem>

// A private temporary directory owned by one request. The directory and everything in it
// is removed when the workspace is released or destroyed, whichever comes first.
class ScopedWorkspace {
  std::filesystem::path path_;
 public:
  ScopedWorkspace() {}
  ~ScopedWorkspace() { Release(); }
  ScopedWorkspace(ScopedWorkspace&&) noexcept;
  ScopedWorkspace& operator=(ScopedWorkspace&&) noexcept;
  ScopedWorkspace(const ScopedWorkspace&) = delete;
  ScopedWorkspace& operator=(const ScopedWorkspace&) = delete;

  // Creates codebox-XXXXXX (mode 0700) under root, or the system temp directory if root is empty.
  // Releases any previously held directory first.
  bool Acquire(const std::filesystem::path& root = {});
  // Removal errors are logged, never thrown.
  void Release() noexcept;

  bool Valid() const { return !path_.empty(); }
  const std::filesystem::path& path() const { return path_; }
};

#endif  // INCLUDE_CODEBOX_WORKSPACE_H_
