#include "benchmark.hpp"

#include <chrono>
#include <stdexcept>
#include "solver.hpp"

double bm(const std::function<void()> &fn, int executions) {
  if (executions <= 0) {
    throw std::invalid_argument("bm: executions must be positive");
  }
  const auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < executions; i++) {
    fn();
  }
  const auto end = std::chrono::steady_clock::now();
  const std::chrono::duration<double, std::milli> elapsed = end - start;
  return elapsed.count() / executions;
}

static std::vector<BenchmarkResult> benchmarkEach(const std::vector<Puzzle> &puzzles, int executions, SolveFn fn) {
  std::vector<BenchmarkResult> results;
  results.reserve(puzzles.size());
  for (const Puzzle &puzzle : puzzles) {
    BenchmarkResult r;
    r.name = puzzle.getName();
    r.meanMs = bm([&puzzle, fn]() { fn(puzzle); }, executions);
    results.push_back(r);
  }
  return results;
}

std::vector<BenchmarkResult> benchmarks(const std::vector<Puzzle> &puzzles, int executions) {
  return benchmarkEach(puzzles, executions, &solveParallel);
}

std::vector<BenchmarkResult> benchmarksSequential(const std::vector<Puzzle> &puzzles, int executions) {
  return benchmarkEach(puzzles, executions, &solve);
}

double benchmarksBatch(const std::vector<Puzzle> &puzzles, int executions) {
  return bm([&puzzles]() { solveAll(puzzles); }, executions);
}
