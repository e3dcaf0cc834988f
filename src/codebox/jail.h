#ifndef CODEBOX_JAIL_H_
#define CODEBOX_JAIL_H_

#include <string>
#include <vector>
#include <filesystem>

#include <cjail/cjail.h>

// exit code of codebox-jail when the jail itself could not be set up
constexpr int kJailLaunchFailure = 125;

class JailOptions;
class CJailCtxClass {
 private:
  std::vector<const char*> argv_buf_;
  struct cjail_ctx ctx_;
 public:
  struct cjail_ctx& GetCtx() { return ctx_; }
  const struct cjail_ctx& GetCtx() const { return ctx_; }

  friend class JailOptions;
};

// Everything codebox-jail needs to run one command; travels on its command line.
class JailOptions {
 public:
  std::vector<std::string> command;
  std::string workdir;
  int uid, gid;
  long wall_time, cpu_time; // us; 0 = unlimited
  long vss, rss; // KiB
  int proc_num;
  long fsize; // KiB
  bool core;

  JailOptions() :
      uid(65534), gid(65534),
      wall_time(0), cpu_time(0),
      vss(0), rss(0),
      proc_num(0),
      fsize(0),
      core(false) {}

  // helper followed by the flags jail_main understands, "--" and the command
  std::vector<std::string> ToArgs(const std::filesystem::path& helper) const;
  // the result is invalidated after reassignment/reallocation of any string/vector member;
  // the environment of the calling process is passed through
  CJailCtxClass ToCJailCtx() const;
};

#endif  // CODEBOX_JAIL_H_
