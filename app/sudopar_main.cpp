#include <cstdio>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "PuzzleFile.hpp"
#include "RunConfig.hpp"
#include "benchmark.hpp"
#include "solver.hpp"

static void usage(const char *argv0) {
  std::cerr
      << "Usage: " << argv0 << " <problems.txt> [--solutions=FILE] [--mode=seq|par|batch] [--bench] [--executions=N] [--only=NAME]\n"
      << "  Each non-empty, non-comment line is 'name: <81 chars>' or '<81 chars>': digits 0-9 or '.' for empty.\n";
}

static std::string toString81(const SudokuGrid &grid) {
  char out81[82];
  grid.exportToString(out81);
  return std::string(out81, 81);
}

static std::string toString81(const Puzzle &puzzle) {
  std::string s(81, '.');
  for (Index i = 0; i < 81; i++) {
    if (puzzle.getValue(i) != 0) {
      s[(size_t)i] = (char)('0' + puzzle.getValue(i));
    }
  }
  return s;
}

static std::vector<SudokuGrid> solveEach(const std::vector<Puzzle> &puzzles, SolveMode mode) {
  std::vector<SudokuGrid> solutions;
  if (mode == SolveMode::Batch) {
    const BatchResult batch = solveAll(puzzles);
    for (const PuzzleSolution &entry : batch.solutions) {
      solutions.push_back(entry.solution);
    }
    return solutions;
  }
  for (const Puzzle &puzzle : puzzles) {
    solutions.push_back(mode == SolveMode::Parallel ? solveParallel(puzzle) : solve(puzzle));
  }
  return solutions;
}

static int runBench(const RunConfig &config, const std::vector<Puzzle> &puzzles) {
  if (config.mode == SolveMode::Batch) {
    const double ms = benchmarksBatch(puzzles, config.executions);
    std::printf("batch of %lu: %.3f ms (mean of %d)\n", (unsigned long)puzzles.size(), ms, config.executions);
    return 0;
  }

  const std::vector<BenchmarkResult> results = config.mode == SolveMode::Parallel
      ? benchmarks(puzzles, config.executions)
      : benchmarksSequential(puzzles, config.executions);
  double total = 0.0;
  for (const BenchmarkResult &r : results) {
    std::printf("%-24s %10.3f ms\n", r.name.c_str(), r.meanMs);
    total += r.meanMs;
  }
  std::printf("%-24s %10.3f ms (mode=%s, mean of %d)\n", "TOTAL", total, modeName(config.mode), config.executions);
  return 0;
}

static int runSolve(const RunConfig &config, const std::vector<Puzzle> &puzzles) {
  std::vector<Puzzle> expected;
  if (!config.solutionsPath.empty()) {
    // aligned one-to-one by position with the problems file
    const std::vector<Puzzle> all = loadPuzzles(config.solutionsPath);
    if (config.only.empty()) {
      expected = all;
    } else {
      for (const Puzzle &p : all) {
        if (p.getName() == config.only) {
          expected.push_back(p);
        }
      }
    }
    if (expected.size() != puzzles.size()) {
      std::cerr << "Solutions file has " << expected.size() << " records, expected " << puzzles.size() << "\n";
      return 2;
    }
  }

  const std::vector<SudokuGrid> solutions = solveEach(puzzles, config.mode);

  size_t passed = 0;
  size_t failed = 0;
  for (size_t i = 0; i < puzzles.size(); i++) {
    const std::string out81 = toString81(solutions[i]);
    std::string why;
    if (solutions[i].isContradiction()) {
      why = "no solution";
    } else if (!expected.empty() && out81 != toString81(expected[i])) {
      why = "differs from expected " + toString81(expected[i]);
    }

    std::cout << "[#" << (i + 1) << " " << puzzles[i].getName() << "]\n"
              << "INPUT:  " << toString81(puzzles[i]) << "\n"
              << "OUTPUT: " << out81 << "\n";
    if (why.empty()) {
      passed++;
      std::cout << "RESULT: PASSED\n\n";
    } else {
      failed++;
      std::cout << "RESULT: FAILED (" << why << ")\n\n";
    }
  }

  std::cout << "SUMMARY: mode=" << modeName(config.mode) << " total=" << puzzles.size()
            << " passed=" << passed << " failed=" << failed << "\n";
  return failed == 0 ? 0 : 1;
}

int main(int argc, char **argv) {
  RunConfig config;
  try {
    config = parseArgs(argc, argv);
  } catch (const std::invalid_argument &e) {
    std::cerr << e.what() << "\n";
    usage(argv[0]);
    return 2;
  }

  std::vector<Puzzle> puzzles;
  try {
    for (const Puzzle &p : loadPuzzles(config.problemsPath)) {
      if (config.only.empty() || p.getName() == config.only) {
        puzzles.push_back(p);
      }
    }
    if (config.bench) {
      return runBench(config, puzzles);
    }
    return runSolve(config, puzzles);
  } catch (const PuzzleFormatError &e) {
    std::cerr << e.what() << "\n";
    return 2;
  }
}
