#ifndef RUN_CONFIG_H
#define RUN_CONFIG_H

#include <cstdint>
#include <string>
#include "benchmark.hpp"

enum class SolveMode : uint8_t {
  Sequential = 0,
  Parallel = 1,
  Batch = 2
};

struct RunConfig {
  RunConfig() : mode(SolveMode::Sequential), bench(false), executions(DEFAULT_EXECUTIONS) { }

  std::string problemsPath;
  std::string solutionsPath;  // optional
  std::string only;           // optional puzzle name filter
  SolveMode mode;
  bool bench;
  int executions;
};

// <problems.txt> [--solutions=FILE] [--mode=seq|par|batch] [--bench] [--executions=N] [--only=NAME]
// Throws std::invalid_argument on unknown options or values.
RunConfig parseArgs(int argc, const char *const *argv);

const char *modeName(SolveMode mode);

#endif // RUN_CONFIG_H
