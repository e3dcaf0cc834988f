#ifndef INCLUDE_CODEBOX_SHELL_CLIENT_H_
#define INCLUDE_CODEBOX_SHELL_CLIENT_H_

#include <string>

#include "session.h"

constexpr int kDefaultCommandTimeout = 5; // seconds
constexpr char kPromptMarker[] = "$ ";

class CommandResult {
 public:
  std::string stdout_text, stderr_text;

  // "Error:" block if there is stderr, otherwise "Output:" block, otherwise "No output".
  std::string FormattedOutput() const;
};

// Drives an interactive session: waits for the prompt, sends a command line and collects
// what the shell prints until the next prompt.
class ShellClient {
  int fd_;
  bool at_prompt_;
  std::string pending_;

  bool ReadUntilPrompt_(std::string& output, long timeout_ms);
 public:
  ShellClient() : fd_(-1), at_prompt_(false) {}
  ~ShellClient() { Close(); }
  ShellClient(const ShellClient&) = delete;
  ShellClient& operator=(const ShellClient&) = delete;

  bool Connect(const ListenAddress&);
  void Close();
  bool Connected() const { return fd_ >= 0; }

  CommandResult RunCommand(const std::string& command, int timeout_seconds = kDefaultCommandTimeout,
                           long prompt_timeout_ms = 1000);
};

#endif  // INCLUDE_CODEBOX_SHELL_CLIENT_H_
