#include <cstdlib>
#include <memory>

#include <nlohmann/json.hpp>
#include <codebox/execution.h>

#include "utils.h"

namespace {

// An analyzer stand-in written as a shell script, so the tests do not need ruff.
class FakeAnalyzer : public testing::Test {
 protected:
  fs::path dir = TestWorkspaceRoot() / "analyzers";

  std::unique_ptr<ExecutionManager> Manager(const std::string& name, const std::string& body) {
    ExecutionOptions options = ShellOptions();
    options.analyzer = {WriteScript(dir, name, body).string()};
    return std::make_unique<ExecutionManager>(SmallProfile(), options);
  }
};

ExecutionRequest Lint(const std::string& code) {
  // the timeout does not apply to linting
  return ExecutionRequest(code, 0, ExecutionMode::LINT);
}

} // namespace

TEST_F(FakeAnalyzer, TextFindings) {
  auto manager = Manager("grep-print", R"(
grep -n print "$1" | sed 's/^\([0-9]*\):.*/script.py:\1:1: T201 `print` found/'
grep -q print "$1" && exit 1
exit 0
)");
  ExecutionResult result = manager->Execute(Lint("x = 1\nprint(x)\ny = 2\nprint(y)\n"));
  EXPECT_EQ(result.exit_status.kind, ExitKind::COMPLETED);
  EXPECT_EQ(result.exit_status.code, 1);
  ASSERT_EQ(result.diagnostics.size(), 2u);
  EXPECT_EQ(result.diagnostics[0].code, "T201");
  EXPECT_EQ(result.diagnostics[0].location.line, 2);
  EXPECT_EQ(result.diagnostics[1].location.line, 4);
  auto rendered = nlohmann::json::parse(result.stdout_text);
  EXPECT_EQ(rendered.size(), 2u);
  EXPECT_EQ(rendered[1]["location"]["line"], 4);

  result = manager->Execute(Lint("x = 1\n"));
  EXPECT_EQ(result.exit_status.code, 0);
  EXPECT_TRUE(result.diagnostics.empty());
  EXPECT_EQ(result.stdout_text, kNoIssuesFound);
}

TEST_F(FakeAnalyzer, JsonFindings) {
  auto manager = Manager("json", R"(
cat <<'EOF'
[{"code": "F821", "message": "Undefined name `z`", "location": {"row": 3, "column": 7}},
 {"code": null, "message": "SyntaxError: unexpected EOF", "location": {"row": 4, "column": 1}}]
EOF
exit 1
)");
  ExecutionResult result = manager->Execute(Lint("print(z)\n"));
  ASSERT_EQ(result.diagnostics.size(), 2u);
  EXPECT_EQ(result.diagnostics[0].code, "F821");
  EXPECT_EQ(result.diagnostics[0].location.column, 7);
  EXPECT_EQ(result.diagnostics[1].code, kSyntaxErrorCode);
  nlohmann::json j = result;
  EXPECT_EQ(j["diagnostics"].size(), 2u);
}

TEST_F(FakeAnalyzer, Crashed) {
  auto manager = Manager("crash", "echo 'internal error' >&2\nexit 2\n");
  EXPECT_THROW(manager->Execute(Lint("x = 1\n")), ManagerError);
}

TEST_F(FakeAnalyzer, Unparseable) {
  auto manager = Manager("garbage", "echo '[not json'\nexit 1\n");
  EXPECT_THROW(manager->Execute(Lint("x = 1\n")), ManagerError);
}

TEST_F(FakeAnalyzer, FindingsWithoutRecords) {
  auto manager = Manager("unknown-format", "echo 'script.py line 1: something is off'\nexit 1\n");
  EXPECT_THROW(manager->Execute(Lint("x = 1\n")), ManagerError);
}

TEST_F(FakeAnalyzer, PositionOutOfRange) {
  auto manager = Manager("huge-line", "echo 'script.py:4294967296:1: F821 Undefined name `x`'\nexit 1\n");
  EXPECT_THROW(manager->Execute(Lint("x = 1\n")), ManagerError);
}

TEST_F(FakeAnalyzer, WorkspaceRemoved) {
  auto manager = Manager("pwd", "pwd >&2\necho '[]'\n");
  ExecutionResult result = manager->Execute(Lint("x = 1\n"));
  std::string workspace = result.stderr_text.substr(0, result.stderr_text.find('\n'));
  ASSERT_FALSE(workspace.empty());
  EXPECT_FALSE(fs::exists(workspace));
}

TEST(Ruff, UndefinedName) {
  if (system("command -v ruff > /dev/null 2>&1") != 0) GTEST_SKIP() << "ruff is not available";
  ExecutionOptions options = ShellOptions();
  options.analyzer[0] = "ruff";
  ExecutionManager manager(SmallProfile(), options);
  ExecutionResult result = manager.Execute(Lint("import os\nprint(undefined_name)\n"));
  EXPECT_EQ(result.exit_status.kind, ExitKind::COMPLETED);
  bool found = false;
  for (auto& i : result.diagnostics) {
    if (i.code == "F821") {
      found = true;
      EXPECT_EQ(i.location.line, 2);
      EXPECT_EQ(i.location.column, 7);
    }
  }
  EXPECT_TRUE(found) << result.stdout_text;

  result = manager.Execute(Lint("x = 1\nprint(x)\n"));
  EXPECT_EQ(result.stdout_text, kNoIssuesFound);
}
