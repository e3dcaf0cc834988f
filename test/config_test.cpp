#include <sstream>

#include <codebox/config.h>

#include "utils.h"

TEST(Config, Defaults) {
  Config config;
  std::istringstream in("");
  ASSERT_TRUE(ParseConfig(in, config));
  EXPECT_EQ(config.profile.max_address_space_bytes, kDefaultAddressSpaceBytes);
  EXPECT_EQ(config.profile.max_output_bytes, kDefaultOutputBytes);
  EXPECT_EQ(config.execution.backend, LimitBackendType::RLIMIT);
  EXPECT_EQ(config.execution.interpreter, std::vector<std::string>{"/usr/bin/python3"});
  EXPECT_EQ(config.execution.analyzer[0], "ruff");
  EXPECT_EQ(config.listen, kDefaultListen);
  EXPECT_EQ(config.session.env_allow, DefaultEnvAllowList());
  EXPECT_EQ(config.execution.worker_uid, 50000);
  EXPECT_EQ(config.execution.worker_uids, 100);
  EXPECT_EQ(config.execution.worker_gid, 65534);
}

TEST(Config, Values) {
  Config config;
  std::istringstream in(R"(
max_address_space_mb = 512
max_cpu_seconds = 30
max_processes = 8
max_output_mb = 2
core_dumps = true
limit_backend = cgroup
workspace_root = /var/lib/codebox
python = /opt/python/bin/python3 -I
ruff = /opt/ruff
env_allow = PATH, LANG ,TZ
worker_uid = 1500
worker_uids = 8
worker_gid = 1501
kill_grace_ms = 200
listen = unix:/run/codebox.sock
shell = /bin/sh -i
prompt = "> "
session_grace_ms = 300
)");
  ASSERT_TRUE(ParseConfig(in, config));
  EXPECT_EQ(config.profile.max_address_space_bytes, 512L * 1024 * 1024);
  EXPECT_EQ(config.profile.max_cpu_seconds, 30);
  EXPECT_EQ(config.profile.max_processes, 8);
  EXPECT_EQ(config.profile.max_output_bytes, 2L * 1024 * 1024);
  EXPECT_TRUE(config.profile.core_dumps_enabled);
  EXPECT_EQ(config.execution.backend, LimitBackendType::CGROUP);
  EXPECT_EQ(config.execution.workspace_root, fs::path("/var/lib/codebox"));
  EXPECT_EQ(config.execution.interpreter, (std::vector<std::string>{"/opt/python/bin/python3", "-I"}));
  EXPECT_EQ(config.execution.analyzer[0], "/opt/ruff");
  EXPECT_EQ(config.execution.analyzer.size(), ExecutionOptions().analyzer.size());
  EXPECT_EQ(config.execution.env_allow, (std::vector<std::string>{"PATH", "LANG", "TZ"}));
  EXPECT_EQ(config.execution.worker_uid, 1500);
  EXPECT_EQ(config.execution.worker_uids, 8);
  EXPECT_EQ(config.execution.worker_gid, 1501);
  EXPECT_EQ(config.execution.grace_ms, 200);
  EXPECT_EQ(config.listen, "unix:/run/codebox.sock");
  EXPECT_EQ(config.session.shell, (std::vector<std::string>{"/bin/sh", "-i"}));
  EXPECT_EQ(config.session.prompt, "> ");
  EXPECT_EQ(config.session.env_allow, config.execution.env_allow);
  EXPECT_EQ(config.session.grace_ms, 300);
}

TEST(Config, UnknownBackend) {
  Config config;
  std::istringstream in("limit_backend = docker\n");
  EXPECT_FALSE(ParseConfig(in, config));
}

TEST(Config, NonPositiveLimit) {
  Config config;
  std::istringstream in("max_processes = 0\n");
  EXPECT_FALSE(ParseConfig(in, config));
}

TEST(Config, RootWorkerIdentity) {
  Config config;
  std::istringstream in("worker_uid = 0\n");
  EXPECT_FALSE(ParseConfig(in, config));
}

TEST(Config, MissingFile) {
  Config config;
  EXPECT_FALSE(ParseConfig(fs::path("/nonexistent/codebox.conf"), config));
}
