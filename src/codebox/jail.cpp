#include "jail.h"

#include <unistd.h>

std::vector<std::string> JailOptions::ToArgs(const std::filesystem::path& helper) const {
  std::vector<std::string> ret = {
    helper.string(),
    "--workdir", workdir,
    "--uid", std::to_string(uid),
    "--gid", std::to_string(gid),
    "--wall-time", std::to_string(wall_time),
    "--cpu-time", std::to_string(cpu_time),
    "--vss", std::to_string(vss),
    "--rss", std::to_string(rss),
    "--proc-num", std::to_string(proc_num),
    "--fsize", std::to_string(fsize),
  };
  if (core) ret.push_back("--core");
  ret.push_back("--");
  ret.insert(ret.end(), command.begin(), command.end());
  return ret;
}

CJailCtxClass JailOptions::ToCJailCtx() const {
  CJailCtxClass ret;
  struct cjail_ctx& ctx = ret.ctx_;
  cjail_ctx_init(&ctx);
  // default: preservefd, sharenet, no chroot; stdio is inherited from the worker
  for (auto& i : command) ret.argv_buf_.push_back(i.data());
  ret.argv_buf_.push_back(nullptr);
  ctx.argv = const_cast<char* const*>(ret.argv_buf_.data());
  ctx.environ = environ;
  ctx.working_dir = workdir.data();
  ctx.cpuset = nullptr;
  ctx.uid = uid;
  ctx.gid = gid;
  ctx.rlim_as = vss;
  if (!core) ctx.rlim_core = 0; // no core dump
  ctx.rlim_fsize = fsize;
  ctx.rlim_proc = proc_num;
  ctx.cg_rss = rss;
  ctx.lim_time.tv_sec = wall_time / 1'000'000;
  ctx.lim_time.tv_usec = wall_time % 1'000'000;
  ctx.lim_cputime.tv_sec = cpu_time / 1'000'000;
  ctx.lim_cputime.tv_usec = cpu_time % 1'000'000;
  return ret;
}
