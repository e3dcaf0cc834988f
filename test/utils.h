#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <string>
#include <vector>

#include <sys/types.h>
#include <gtest/gtest.h>
#include <codebox/paths.h>
#include <codebox/execution.h>

// per-process directory under the system temp directory; removed after all tests
fs::path TestWorkspaceRoot();

// Runs guest code with /bin/sh so the tests do not depend on a Python installation.
ExecutionOptions ShellOptions();
ResourceLimitProfile SmallProfile();

bool HasExecutable(const std::string& path);
// Writes an executable shell script and returns its path.
fs::path WriteScript(const fs::path& dir, const std::string& name, const std::string& body);
// entries of dir whose name starts with prefix
size_t CountEntries(const fs::path& dir, const std::string& prefix = "");
bool ProcessAlive(pid_t pid);
// a killed process may take a moment to go away
bool ExitsWithin(pid_t pid, long timeout_ms);

#define SKIP_UNLESS_EXECUTABLE(path) \
  if (!HasExecutable(path)) GTEST_SKIP() << path << " is not available"

#endif // TEST_UTILS_H_
