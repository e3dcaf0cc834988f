#ifndef INCLUDE_CODEBOX_LIMITS_H_
#define INCLUDE_CODEBOX_LIMITS_H_

// Ceilings callers size their requests against; changing them changes the external contract.
constexpr long kDefaultAddressSpaceBytes = 2L * 1024 * 1024 * 1024; // 2 GiB
constexpr long kDefaultCpuSeconds = 600;
constexpr long kDefaultProcesses = 50;
constexpr long kDefaultOutputBytes = 50L * 1024 * 1024; // 50 MiB

#define ENUM_LIMIT_BACKEND_ \
  X(RLIMIT, "rlimit") /* default */ \
  X(CGROUP, "cgroup") \
  X(NAMESPACE, "namespace") \
  X(JAIL, "jail")
enum class LimitBackendType {
#define X(name, confname) name,
  ENUM_LIMIT_BACKEND_
#undef X
};

// Applied to a worker after it drops privileges and before it runs guest code.
// The manager keeps its copy const; every worker reads the same values.
class ResourceLimitProfile {
 public:
  long max_address_space_bytes;
  long max_cpu_seconds;
  long max_processes;
  long max_output_bytes; // per captured stream; also the file size limit
  bool core_dumps_enabled;

  ResourceLimitProfile() :
      max_address_space_bytes(kDefaultAddressSpaceBytes),
      max_cpu_seconds(kDefaultCpuSeconds),
      max_processes(kDefaultProcesses),
      max_output_bytes(kDefaultOutputBytes),
      core_dumps_enabled(false) {}

  bool Valid() const;
};

#endif  // INCLUDE_CODEBOX_LIMITS_H_
