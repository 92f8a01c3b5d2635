#ifndef BENCHMARK_H
#define BENCHMARK_H

#include <functional>
#include <string>
#include <vector>
#include "Puzzle.hpp"

static constexpr int DEFAULT_EXECUTIONS = 42;

struct BenchmarkResult {
  std::string name;
  double meanMs;
};

// runs fn `executions` times, returns the mean wall-clock time in milliseconds
double bm(const std::function<void()> &fn, int executions);

// solveParallel, per puzzle
std::vector<BenchmarkResult> benchmarks(const std::vector<Puzzle> &puzzles, int executions = DEFAULT_EXECUTIONS);

// solve, per puzzle
std::vector<BenchmarkResult> benchmarksSequential(const std::vector<Puzzle> &puzzles, int executions = DEFAULT_EXECUTIONS);

// solveAll over the whole collection
double benchmarksBatch(const std::vector<Puzzle> &puzzles, int executions = DEFAULT_EXECUTIONS);

#endif // BENCHMARK_H
