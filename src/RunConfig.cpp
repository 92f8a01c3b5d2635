#include "RunConfig.hpp"

#include <cstring>
#include <stdexcept>

static bool hasPrefix(const std::string &a, const char *prefix) {
  return a.rfind(prefix, 0) == 0;
}

static SolveMode parseMode(const std::string &value) {
  if (value == "seq") {
    return SolveMode::Sequential;
  }
  if (value == "par") {
    return SolveMode::Parallel;
  }
  if (value == "batch") {
    return SolveMode::Batch;
  }
  throw std::invalid_argument("Unknown mode: " + value);
}

static int parseExecutions(const std::string &value) {
  size_t used = 0;
  int n = 0;
  try {
    n = std::stoi(value, &used);
  } catch (const std::logic_error &) {
    throw std::invalid_argument("Invalid execution count: " + value);
  }
  if (used != value.size() || n <= 0) {
    throw std::invalid_argument("Invalid execution count: " + value);
  }
  return n;
}

RunConfig parseArgs(int argc, const char *const *argv) {
  RunConfig config;
  for (int i = 1; i < argc; i++) {
    const std::string a = argv[i];
    if (hasPrefix(a, "--mode=")) {
      config.mode = parseMode(a.substr(std::strlen("--mode=")));
    } else if (hasPrefix(a, "--solutions=")) {
      config.solutionsPath = a.substr(std::strlen("--solutions="));
    } else if (hasPrefix(a, "--executions=")) {
      config.executions = parseExecutions(a.substr(std::strlen("--executions=")));
    } else if (hasPrefix(a, "--only=")) {
      config.only = a.substr(std::strlen("--only="));
    } else if (a == "--bench") {
      config.bench = true;
    } else if (hasPrefix(a, "--")) {
      throw std::invalid_argument("Unknown option: " + a);
    } else if (config.problemsPath.empty()) {
      config.problemsPath = a;
    } else {
      throw std::invalid_argument("Unexpected argument: " + a);
    }
  }
  if (config.problemsPath.empty()) {
    throw std::invalid_argument("Missing problems file");
  }
  return config;
}

const char *modeName(SolveMode mode) {
  switch (mode) {
    case SolveMode::Sequential:
      return "seq";
    case SolveMode::Parallel:
      return "par";
    case SolveMode::Batch:
      return "batch";
  }
  return "?";
}
