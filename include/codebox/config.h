#ifndef INCLUDE_CODEBOX_CONFIG_H_
#define INCLUDE_CODEBOX_CONFIG_H_

#include <string>
#include <istream>
#include <filesystem>

#include "limits.h"
#include "session.h"
#include "execution.h"

constexpr char kDefaultConfigPath[] = "/etc/codebox.conf";
constexpr char kDefaultListen[] = "tcp://0.0.0.0:8080";

class Config {
 public:
  ResourceLimitProfile profile;
  ExecutionOptions execution;
  std::string listen;
  SessionOptions session;

  Config() : listen(kDefaultListen) {}
};

// INI with all keys in the global section; keys absent from the file keep their current value.
bool ParseConfig(std::istream&, Config&);
bool ParseConfig(const std::filesystem::path&, Config&);

#endif  // INCLUDE_CODEBOX_CONFIG_H_
