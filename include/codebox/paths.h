#ifndef INCLUDE_CODEBOX_PATHS_H_
#define INCLUDE_CODEBOX_PATHS_H_

#include <filesystem>

namespace fs = std::filesystem;

namespace internal {

// does not meant to be publicly used; only for testing
extern fs::path kDataDir;

} // internal

// name of the guest code file inside a workspace
extern const char kScriptName[];

fs::path DefaultWorkspaceRoot();
fs::path DefaultJailHelper();
fs::path DefaultCgroupRoot();

#endif  // INCLUDE_CODEBOX_PATHS_H_
