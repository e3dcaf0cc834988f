#include <codebox/limits.h>

bool ResourceLimitProfile::Valid() const {
  return max_address_space_bytes > 0 && max_cpu_seconds > 0 &&
         max_processes > 0 && max_output_bytes > 0;
}
