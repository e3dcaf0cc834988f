#ifndef INCLUDE_CODEBOX_UTILS_H_
#define INCLUDE_CODEBOX_UTILS_H_

#include <string>
#include <optional>

#include "limits.h"
#include "session.h"
#include "execution.h"

const char* LimitBackendName(LimitBackendType);
std::optional<LimitBackendType> GetLimitBackend(const std::string&);

const char* ExitKindName(ExitKind);
std::optional<ExitKind> GetExitKind(const std::string&);

// logging
const char* ExecutionModeName(ExecutionMode);
const char* SessionStateName(SessionState);
// "SIGKILL"; "signal N" for unknown numbers
std::string SignalName(int signal);

#endif  // INCLUDE_CODEBOX_UTILS_H_
