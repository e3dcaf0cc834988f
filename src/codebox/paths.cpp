#include <codebox/paths.h>

namespace internal {
fs::path kDataDir = fs::path(CODEBOX_DATA_DIR);
} // internal

const char kScriptName[] = "script.py";

fs::path DefaultWorkspaceRoot() {
  std::error_code ec;
  fs::path ret = fs::temp_directory_path(ec);
  if (ec) return "/tmp";
  return ret;
}

fs::path DefaultJailHelper() {
  return internal::kDataDir / "codebox-jail";
}

fs::path DefaultCgroupRoot() {
  return "/sys/fs/cgroup/codebox";
}
