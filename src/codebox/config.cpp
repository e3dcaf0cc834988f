#include <codebox/config.h>

#include <fstream>

#include <tortellini.hh>
#include <spdlog/spdlog.h>

#include <codebox/utils.h>
#include "utils.h"

namespace {

constexpr long kMiB = 1024L * 1024;

// values with significant surrounding spaces (the prompt) can be quoted
std::string Unquote(const std::string& str) {
  if (str.size() >= 2 && (str.front() == '"' || str.front() == '\'') && str.back() == str.front()) {
    return str.substr(1, str.size() - 2);
  }
  return str;
}

} // namespace

bool ParseConfig(std::istream& in, Config& config) {
  tortellini::ini ini;
  in >> ini;
  auto global = ini[""];

  ResourceLimitProfile& profile = config.profile;
  profile.max_address_space_bytes =
      (global["max_address_space_mb"] | (profile.max_address_space_bytes / kMiB)) * kMiB;
  profile.max_cpu_seconds = global["max_cpu_seconds"] | profile.max_cpu_seconds;
  profile.max_processes = global["max_processes"] | profile.max_processes;
  profile.max_output_bytes = (global["max_output_mb"] | (profile.max_output_bytes / kMiB)) * kMiB;
  profile.core_dumps_enabled = global["core_dumps"] | profile.core_dumps_enabled;
  if (!profile.Valid()) {
    spdlog::error("Resource limits must be positive");
    return false;
  }

  ExecutionOptions& exec = config.execution;
  std::string backend = global["limit_backend"] | std::string(LimitBackendName(exec.backend));
  if (auto type = GetLimitBackend(backend)) {
    exec.backend = type.value();
  } else {
    spdlog::error("Unknown limit_backend {}", backend);
    return false;
  }
  exec.workspace_root = global["workspace_root"] | exec.workspace_root.string();
  if (std::string python = global["python"] | std::string(); !python.empty()) {
    exec.interpreter = SplitWords(python);
  }
  if (std::string ruff = global["ruff"] | std::string(); !ruff.empty()) {
    exec.analyzer[0] = ruff;
  }
  if (std::string allow = global["env_allow"] | std::string(); !allow.empty()) {
    exec.env_allow = SplitList(allow, ',');
  }
  exec.worker_uid = global["worker_uid"] | exec.worker_uid;
  exec.worker_uids = global["worker_uids"] | exec.worker_uids;
  exec.worker_gid = global["worker_gid"] | exec.worker_gid;
  if (exec.worker_uid <= 0 || exec.worker_uids <= 0 || exec.worker_gid < 0) {
    spdlog::error("Worker identities must be unprivileged ids");
    return false;
  }
  exec.cgroup_root = global["cgroup_root"] | exec.cgroup_root.string();
  exec.jail_helper = global["jail_helper"] | exec.jail_helper.string();
  exec.grace_ms = global["kill_grace_ms"] | exec.grace_ms;

  config.listen = global["listen"] | config.listen;
  SessionOptions& session = config.session;
  if (std::string shell = global["shell"] | std::string(); !shell.empty()) {
    session.shell = SplitWords(shell);
  }
  session.prompt = Unquote(global["prompt"] | session.prompt);
  session.env_allow = exec.env_allow;
  session.workspace_root = exec.workspace_root;
  session.grace_ms = global["session_grace_ms"] | session.grace_ms;
  if (exec.grace_ms < 0 || session.grace_ms < 0) {
    spdlog::error("Grace periods must not be negative");
    return false;
  }
  return true;
}

bool ParseConfig(const fs::path& path, Config& config) {
  std::ifstream fin(path);
  if (!fin) {
    spdlog::error("Failed opening configuration file {}", path.c_str());
    return false;
  }
  return ParseConfig(fin, config);
}
