#ifndef INCLUDE_CODEBOX_LOGGER_H_
#define INCLUDE_CODEBOX_LOGGER_H_

// Keeps the console sinks usable in children created by fork().
void InitLogger();
// 0 = warn, 1 = info, 2+ = debug
void SetVerbosity(int verbosity);

#endif  // INCLUDE_CODEBOX_LOGGER_H_
