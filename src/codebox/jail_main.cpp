#include <errno.h>
#include <signal.h>
#include <unistd.h>
#include <sys/resource.h>
#include <cstring>
#include <iostream>

#include <argparse/argparse.hpp>

#include "jail.h"

namespace {

JailOptions ParseArgs(int argc, char** argv) {
  argparse::ArgumentParser parser(argc ? argv[0] : "codebox-jail");
  parser.add_argument("--workdir").required().help("Working directory of the command");
  parser.add_argument("--uid").scan<'d', int>().default_value(65534);
  parser.add_argument("--gid").scan<'d', int>().default_value(65534);
  parser.add_argument("--wall-time").scan<'d', long>().default_value(0L).help("us");
  parser.add_argument("--cpu-time").scan<'d', long>().default_value(0L).help("us");
  parser.add_argument("--vss").scan<'d', long>().default_value(0L).help("KiB");
  parser.add_argument("--rss").scan<'d', long>().default_value(0L).help("KiB");
  parser.add_argument("--proc-num").scan<'d', int>().default_value(0);
  parser.add_argument("--fsize").scan<'d', long>().default_value(0L).help("KiB");
  parser.add_argument("--core").default_value(false).implicit_value(true);
  parser.add_argument("command").remaining();

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(kJailLaunchFailure);
  }
  JailOptions opt;
  opt.workdir = parser.get<std::string>("--workdir");
  opt.uid = parser.get<int>("--uid");
  opt.gid = parser.get<int>("--gid");
  opt.wall_time = parser.get<long>("--wall-time");
  opt.cpu_time = parser.get<long>("--cpu-time");
  opt.vss = parser.get<long>("--vss");
  opt.rss = parser.get<long>("--rss");
  opt.proc_num = parser.get<int>("--proc-num");
  opt.fsize = parser.get<long>("--fsize");
  opt.core = parser.get<bool>("--core");
  try {
    opt.command = parser.get<std::vector<std::string>>("command");
  } catch (std::logic_error&) {
    // no command given
  }
  if (opt.command.empty()) {
    std::cerr << "No command given" << std::endl;
    exit(kJailLaunchFailure);
  }
  return opt;
}

} // namespace

// Runs one command in a cjail jail and ends the same way the command did, so the
// manager can read the wait status of this process as the guest's.
int main(int argc, char** argv) {
  JailOptions opt = ParseArgs(argc, argv);
  CJailCtxClass ctx = opt.ToCJailCtx();
  struct cjail_result res = {};
  if (cjail_exec(&ctx.GetCtx(), &res) < 0) {
    std::cerr << "cjail_exec: " << strerror(errno) << std::endl;
    return kJailLaunchFailure;
  }
  if (res.timekill > 0 || res.oomkill > 0) raise(SIGKILL);
  if (res.info.si_code == CLD_EXITED) return res.info.si_status;
  int sig = res.info.si_status;
  // reproduce the signal without leaving a core of this helper
  struct rlimit no_core = {0, 0};
  if (setrlimit(RLIMIT_CORE, &no_core) < 0) std::cerr << "setrlimit: " << strerror(errno) << std::endl;
  signal(sig, SIG_DFL);
  raise(sig);
  // signals whose default action is to ignore
  return 128 + sig;
}
