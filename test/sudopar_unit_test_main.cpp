#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <functional>
#include <initializer_list>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "ConstraintEngine.hpp"
#include "Mailbox.hpp"
#include "PuzzleFile.hpp"
#include "RunConfig.hpp"
#include "SearchEngine.hpp"
#include "TaskGroup.hpp"
#include "Validator.hpp"
#include "benchmark.hpp"
#include "solver.hpp"

static const char *WIKIPEDIA =
    "530070000600195000098000060800060003400803001700020006060000280000419005000080079";
static const char *WIKIPEDIA_SOLUTION =
    "534678912672195348198342567859761423426853791713924856961537284287419635345286179";
static const char *EULER01 =
    "003020600900305001001806400008102900700000008006708200002609500800203009005010300";
static const char *EULER01_SOLUTION =
    "483921657967345821251876493548132976729564138136798245372689514814253769695417382";
static const char *ESCARGOT =
    "100007090030020008009600500005300900010080002600004000300000010040000007007000300";
static const char *ESCARGOT_SOLUTION =
    "162857493534129678789643521475312986913586742628794135356478219241935867897261354";
static const char *EASTER_MONSTER =
    "100000002090400050006000700050903000000070000000850040700000600030009080002000001";

// =========================================================
// Minimal harness
// =========================================================

static size_t g_checks = 0;
static size_t g_failures = 0;

#define CHECK(cond)                                                                   \
  do {                                                                                \
    g_checks++;                                                                       \
    if (!(cond)) {                                                                    \
      g_failures++;                                                                   \
      std::cout << "  CHECK FAILED: " #cond " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
    }                                                                                 \
  } while (0)

#define CHECK_THROWS(expr, type)                                                      \
  do {                                                                                \
    bool thrown = false;                                                              \
    try {                                                                             \
      (void)(expr);                                                                   \
    } catch (const type &) {                                                          \
      thrown = true;                                                                  \
    }                                                                                 \
    CHECK(thrown && "expected " #type);                                               \
  } while (0)

static void runCase(const char *name, const std::function<void()> &body) {
  const size_t before = g_failures;
  try {
    body();
  } catch (const std::exception &e) {
    g_failures++;
    std::cout << "  unexpected exception: " << e.what() << "\n";
  }
  std::cout << "[" << name << "] RESULT: " << (g_failures == before ? "PASSED" : "FAILED") << "\n";
}

// =========================================================
// Helpers
// =========================================================

static std::string toString81(const SudokuGrid &grid) {
  char out81[82];
  grid.exportToString(out81);
  return std::string(out81, 81);
}

static SudokuGrid gridFrom(const char *in81) {
  return fill(Puzzle("fixture", in81));
}

// a mix of fixed cells and arbitrary non-empty candidate sets
static SudokuGrid randomGrid(std::mt19937 &rng) {
  std::uniform_int_distribution<int> digit(1, 9);
  std::uniform_int_distribution<int> mask(1, ALL_DIGITS);
  std::bernoulli_distribution isFixed(0.4);
  SudokuGrid grid;
  for (Index idx = 0; idx < 81; idx++) {
    if (isFixed(rng)) {
      grid.setCell(idx, SudokuCell::fixed((Digit)digit(rng)));
    } else {
      grid.setCell(idx, SudokuCell::candidates((Mask)mask(rng)));
    }
  }
  return grid;
}

static SudokuRow rowOf(const std::vector<SudokuCell> &cells) {
  SudokuRow row;
  for (int k = 0; k < 9; k++) {
    row.set(k, cells[(size_t)k]);
  }
  return row;
}

static Mask maskOf(std::initializer_list<int> digits) {
  Mask m = 0;
  for (int d : digits) {
    m = (Mask)(m | digitToBit((Digit)d));
  }
  return m;
}

// =========================================================
// Cells
// =========================================================

static void testCellCandidates() {
  const SudokuCell single = SudokuCell::candidates(maskOf({ 4 }));
  CHECK(!single.isDecided());
  CHECK(single.getSingleCandidate() == 4);

  const SudokuCell pair = SudokuCell::candidates(maskOf({ 2, 7 }));
  CHECK(pair.getSingleCandidate() == 0);
  CHECK(pair.hasCandidate(2));
  CHECK(pair.hasCandidate(7));
  CHECK(!pair.hasCandidate(3));
  CHECK(pair.countCandidates() == 2);

  CHECK(SudokuCell::fixed(5).hasCandidate(5));
  CHECK(!SudokuCell::fixed(5).hasCandidate(6));
  CHECK(SudokuCell::candidates(0).isContradiction());
  CHECK(SudokuCell::candidates(0).getSingleCandidate() == 0);
}

// =========================================================
// Grid transforms
// =========================================================

static void testTranspose() {
  std::mt19937 rng(7);
  for (int n = 0; n < 50; n++) {
    const SudokuGrid g = randomGrid(rng);
    CHECK(g.transpose().transpose() == g);
    const SudokuGrid t = g.transpose();
    for (int i = 1; i <= 9; i++) {
      for (int j = 1; j <= 9; j++) {
        CHECK(t.valueAt(i, j) == g.valueAt(j, i));
      }
    }
  }
  CHECK(SudokuGrid::contradiction().transpose().isContradiction());
}

static void testBlockView() {
  std::mt19937 rng(11);
  for (int n = 0; n < 50; n++) {
    const SudokuGrid g = randomGrid(rng);
    CHECK(g.toBlockView().fromBlockView() == g);
  }

  // block 1 (top middle) read row-major: columns 4..6 of rows 1..3
  const SudokuGrid g = gridFrom(WIKIPEDIA_SOLUTION);
  const SudokuRow block = g.toBlockView().getRow(1);
  const Digit expected[9] = { 6, 7, 8, 1, 9, 5, 3, 4, 2 };
  for (int k = 0; k < 9; k++) {
    CHECK(block.at(k).getValue() == expected[k]);
  }
  CHECK(SudokuGrid::contradiction().toBlockView().isContradiction());
  CHECK(SudokuGrid::contradiction().fromBlockView().isContradiction());
}

static void testReplaceCell() {
  std::mt19937 rng(13);
  const SudokuGrid g = randomGrid(rng);
  for (int i = 1; i <= 9; i++) {
    for (int j = 1; j <= 9; j++) {
      CHECK(g.replaceCell(i, j, g.valueAt(i, j)) == g);
    }
  }

  const SudokuGrid h = g.replaceCell(4, 7, SudokuCell::fixed(3));
  CHECK(h.valueAt(4, 7) == SudokuCell::fixed(3));
  for (int i = 1; i <= 9; i++) {
    for (int j = 1; j <= 9; j++) {
      if (i != 4 || j != 7) {
        CHECK(h.valueAt(i, j) == g.valueAt(i, j));
      }
    }
  }

  CHECK_THROWS(g.replaceCell(0, 1, SudokuCell::fixed(1)), std::out_of_range);
  CHECK_THROWS(g.replaceCell(1, 10, SudokuCell::fixed(1)), std::out_of_range);
  CHECK_THROWS(g.valueAt(10, 1), std::out_of_range);
}

// =========================================================
// Constraint engine
// =========================================================

static void testFill() {
  const SudokuGrid g = gridFrom(WIKIPEDIA);
  CHECK(g.valueAt(1, 1) == SudokuCell::fixed(5));
  CHECK(g.valueAt(1, 3) == SudokuCell::candidates(ALL_DIGITS));
  CHECK(hardness(g) == (81 - 30) * 9);
}

static void testRefineRow() {
  const SudokuCell all = SudokuCell::candidates(ALL_DIGITS);

  // fixed digits leave every candidate set
  SudokuRow r = refineRow(rowOf({ SudokuCell::fixed(5), all, all, all, all, all, all, all, SudokuCell::fixed(2) }));
  CHECK(!r.isContradiction());
  CHECK(r.at(1) == SudokuCell::candidates((Mask)(ALL_DIGITS & ~maskOf({ 2, 5 }))));

  // a singleton becomes fixed
  r = refineRow(rowOf({ SudokuCell::fixed(1), SudokuCell::fixed(2), SudokuCell::fixed(3), SudokuCell::fixed(4),
                        SudokuCell::fixed(5), SudokuCell::fixed(6), SudokuCell::fixed(7), SudokuCell::fixed(8), all }));
  CHECK(r.at(8) == SudokuCell::fixed(9));

  // a cell driven empty
  r = refineRow(rowOf({ SudokuCell::fixed(1), SudokuCell::candidates(maskOf({ 1 })), all, all, all, all, all, all, all }));
  CHECK(r.isContradiction());

  // two cells fixed to the same digit in one pass
  r = refineRow(rowOf({ SudokuCell::fixed(1), SudokuCell::candidates(maskOf({ 1, 4 })),
                        SudokuCell::candidates(maskOf({ 1, 4 })), all, all, all, all, all, all }));
  CHECK(r.isContradiction());

  // duplicate givens
  r = refineRow(rowOf({ SudokuCell::fixed(5), SudokuCell::fixed(5), all, all, all, all, all, all, all }));
  CHECK(r.isContradiction());

  CHECK(refineRow(SudokuRow::contradiction()).isContradiction());
}

static void testDuplicateGivenIsContradiction() {
  // two 5s in row 1
  std::string p = WIKIPEDIA;
  p[2] = '5';
  const SudokuGrid refined = refine(gridFrom(p.c_str()));
  CHECK(refined.isContradiction());
  CHECK(refineParallel(gridFrom(p.c_str())).isContradiction());
  CHECK(solved(refined));
  CHECK(solve(Puzzle("dup", p.c_str())).isContradiction());
}

static void testRefineFixpoint() {
  const char *puzzles[] = { WIKIPEDIA, EULER01, ESCARGOT, EASTER_MONSTER };
  for (const char *p : puzzles) {
    const SudokuGrid once = refine(gridFrom(p));
    CHECK(refine(once) == once);
    CHECK(refineParallel(gridFrom(p)) == once);
  }

  // propagation alone completes the easy puzzles
  CHECK(toString81(refine(gridFrom(WIKIPEDIA))) == WIKIPEDIA_SOLUTION);
  CHECK(toString81(refine(gridFrom(EULER01))) == EULER01_SOLUTION);
  CHECK(!solved(refine(gridFrom(ESCARGOT))));
}

static void testRefineParallelMatchesSequential() {
  // branch states, as produced during search
  const SudokuGrid base = refine(gridFrom(EASTER_MONSTER));
  const Guess g = guess(base);
  for (Digit d = 1; d <= 9; d++) {
    if ((g.candidates & digitToBit(d)) == 0) {
      continue;
    }
    const SudokuGrid branch = base.replaceCell(g.row, g.col, SudokuCell::fixed(d));
    CHECK(refineParallel(branch) == refine(branch));
  }

  std::mt19937 rng(17);
  for (int n = 0; n < 20; n++) {
    const SudokuGrid r = randomGrid(rng);
    CHECK(refineParallel(r) == refine(r));
  }
}

// =========================================================
// Search engine
// =========================================================

static void testSolved() {
  CHECK(solved(SudokuGrid::contradiction()));
  CHECK(!solved(gridFrom(WIKIPEDIA)));
  CHECK(solved(gridFrom(WIKIPEDIA_SOLUTION)));
}

static void testGuessTieBreak() {
  const Mask two = maskOf({ 4, 8 });
  SudokuGrid g;
  g = g.replaceCell(3, 5, SudokuCell::candidates(two));
  g = g.replaceCell(2, 7, SudokuCell::candidates(two));
  g = g.replaceCell(2, 9, SudokuCell::candidates(two));
  g = g.replaceCell(1, 1, SudokuCell::candidates(maskOf({ 1, 2, 3 })));

  const Guess first = guess(g);
  CHECK(first.row == 2);
  CHECK(first.col == 7);
  CHECK(first.candidates == two);

  // fewer candidates wins over position
  g = g.replaceCell(9, 9, SudokuCell::candidates(maskOf({ 6 })));
  const Guess second = guess(g);
  CHECK(second.row == 9);
  CHECK(second.col == 9);

  CHECK_THROWS(guess(gridFrom(WIKIPEDIA_SOLUTION)), std::logic_error);
}

static void testHardness() {
  CHECK(hardness(SudokuGrid()) == 729);
  CHECK(hardness(gridFrom(WIKIPEDIA_SOLUTION)) == 0);
  CHECK(hardness(SudokuGrid().replaceCell(1, 1, SudokuCell::fixed(1))) == 720);
}

static void testGuessesEasiestFirst() {
  const SudokuGrid base = refine(gridFrom(ESCARGOT));
  const Guess g = guess(base);
  const std::vector<SudokuGrid> children = guesses(base);

  CHECK(!children.empty());
  CHECK(children.size() <= (size_t)countBits9(g.candidates));
  for (size_t i = 0; i < children.size(); i++) {
    CHECK(!children[i].isContradiction());
    const SudokuCell &cell = children[i].valueAt(g.row, g.col);
    CHECK(cell.isFixed());
    CHECK((g.candidates & digitToBit(cell.getValue())) != 0);
    CHECK(refine(children[i]) == children[i]);
    if (i > 0) {
      CHECK(hardness(children[i - 1]) <= hardness(children[i]));
    }
  }
}

static void testSolveOne() {
  CHECK(solveOne(std::vector<SudokuGrid>()).isContradiction());

  std::vector<SudokuGrid> branches;
  branches.push_back(refine(gridFrom(ESCARGOT)).replaceCell(1, 1, SudokuCell::fixed(1)));
  CHECK(toString81(solveOne(branches)) == ESCARGOT_SOLUTION);
}

// =========================================================
// Solver
// =========================================================

static void testSolveKnownSolutions() {
  const char *puzzles[][2] = {
    { WIKIPEDIA, WIKIPEDIA_SOLUTION },
    { EULER01, EULER01_SOLUTION },
    { ESCARGOT, ESCARGOT_SOLUTION },
  };
  for (const auto &entry : puzzles) {
    const Puzzle p("known", entry[0]);
    CHECK(toString81(solve(p)) == entry[1]);
    CHECK(toString81(solveParallel(p)) == entry[1]);
  }
}

static void testSolveEmptyAndUnsolvable() {
  const SudokuGrid any = solve(Puzzle("empty", std::string(81, '0').c_str()));
  CHECK(!any.isContradiction());
  CHECK(validSolution(any));

  // consistent givens, but a 1 where the unique solution has a 4
  std::string p = WIKIPEDIA;
  p[2] = '1';
  CHECK(solve(Puzzle("unsolvable", p.c_str())).isContradiction());
  CHECK(solveParallel(Puzzle("unsolvable", p.c_str())).isContradiction());
}

static void testCFacade() {
  char out81[82];
  CHECK(sudopar_solver_full(WIKIPEDIA, out81) == 1);
  CHECK(std::string(out81) == WIKIPEDIA_SOLUTION);

  std::memset(out81, 0, sizeof(out81));
  CHECK(sudopar_solver_parallel(ESCARGOT, out81) == 1);
  CHECK(std::string(out81) == ESCARGOT_SOLUTION);

  CHECK(sudopar_solver_full("123", out81) == 0);
  CHECK(sudopar_solver_full(nullptr, out81) == 0);
  CHECK(sudopar_solver_full(WIKIPEDIA, nullptr) == 0);

  std::string dup = WIKIPEDIA;
  dup[2] = '5';
  CHECK(sudopar_solver_full(dup.c_str(), out81) == 0);
  CHECK(std::string(out81) == std::string(81, '.'));
}

static void testBatch() {
  std::vector<Puzzle> batch;
  batch.push_back(Puzzle("wikipedia", WIKIPEDIA));
  batch.push_back(Puzzle("euler01", EULER01));
  batch.push_back(Puzzle("escargot", ESCARGOT));
  batch.push_back(Puzzle("wikipedia-again", WIKIPEDIA));

  const BatchResult result = solveAll(batch);
  CHECK(result.launched == batch.size());
  CHECK(result.completions == batch.size());
  CHECK(result.solutions.size() == batch.size());
  CHECK(result.solutions[0].name == "wikipedia");
  CHECK(result.solutions[2].name == "escargot");
  CHECK(toString81(result.solutions[0].solution) == WIKIPEDIA_SOLUTION);
  CHECK(toString81(result.solutions[1].solution) == EULER01_SOLUTION);
  CHECK(toString81(result.solutions[2].solution) == ESCARGOT_SOLUTION);
  CHECK(toString81(result.solutions[3].solution) == WIKIPEDIA_SOLUTION);

  const BatchResult empty = solveAll(std::vector<Puzzle>());
  CHECK(empty.launched == 0);
  CHECK(empty.completions == 0);
}

static SudokuGrid solveOrFault(const Puzzle &puzzle) {
  if (puzzle.getName() == "broken") {
    throw InvalidSolutionFault(SudokuGrid::contradiction());
  }
  return solve(puzzle);
}

static void testBatchFaultRethrown() {
  std::vector<Puzzle> batch;
  batch.push_back(Puzzle("wikipedia", WIKIPEDIA));
  batch.push_back(Puzzle("broken", EULER01));
  batch.push_back(Puzzle("escargot", ESCARGOT));

  bool thrown = false;
  try {
    solveAll(batch, &solveOrFault);
  } catch (const InvalidSolutionFault &fault) {
    thrown = true;
    CHECK(fault.getGrid().isContradiction());
  }
  CHECK(thrown);

  // the same seam with a well-behaved solver still fills every slot
  const BatchResult result = solveAll(batch, &solve);
  CHECK(result.completions == batch.size());
  CHECK(result.solutions[1].name == "broken");
  CHECK(toString81(result.solutions[1].solution) == EULER01_SOLUTION);
}

// =========================================================
// Validator
// =========================================================

static void testValidator() {
  const SudokuGrid good = gridFrom(WIKIPEDIA_SOLUTION);
  CHECK(validSolution(good));
  CHECK(validSolution(SudokuGrid::contradiction()));
  CHECK(!validSolution(gridFrom(WIKIPEDIA)));

  // swapping two cells of a row keeps the row valid but breaks columns
  const SudokuGrid swapped = good.replaceCell(1, 1, good.valueAt(1, 2)).replaceCell(1, 2, good.valueAt(1, 1));
  CHECK(!validSolution(swapped));

  CHECK(&checkedSolution(good) == &good);
  bool thrown = false;
  try {
    checkedSolution(swapped);
  } catch (const InvalidSolutionFault &fault) {
    thrown = true;
    CHECK(fault.getGrid() == swapped);
  }
  CHECK(thrown);
}

// =========================================================
// Coordinator
// =========================================================

static void testMailbox() {
  Mailbox<int> box;
  CHECK(box.empty());
  CHECK(box.push(Message<int>(3, 30)));
  CHECK(!box.push(Message<int>(3, 31)));
  CHECK(box.delivered(3));
  CHECK(!box.delivered(4));
  CHECK(box.size() == 1);
  const Message<int> msg = box.receive();
  CHECK(msg.taskIdx == 3);
  CHECK(msg.result == 30);
  CHECK(!msg.failed());
  // still one-shot after being received
  CHECK(!box.push(Message<int>(3, 32)));
}

static void testTaskGroupOrdering() {
  TaskGroup<int> group(9);
  for (int i = 0; i < 9; i++) {
    // later tasks finish first
    group.launch([i]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(5 * (9 - i)));
      return i * i;
    });
  }
  CHECK(group.launched() == 9);
  const std::vector<int> results = group.join();
  CHECK(group.completions() == 9);
  CHECK(results.size() == 9);
  for (int i = 0; i < 9; i++) {
    CHECK(results[(size_t)i] == i * i);
  }
}

static void testTaskGroupFailure() {
  std::atomic<int> finished(0);
  TaskGroup<int> group(6);
  for (int i = 0; i < 6; i++) {
    group.launch([i, &finished]() -> int {
      if (i == 2) {
        throw std::runtime_error("task 2 failed");
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      finished++;
      return i;
    });
  }

  bool thrown = false;
  try {
    group.join();
  } catch (const std::runtime_error &e) {
    thrown = std::string(e.what()) == "task 2 failed";
  }
  CHECK(thrown);
  // no cancellation: the siblings ran to completion
  CHECK(finished.load() == 5);
  CHECK(group.completions() == 6);
}

// =========================================================
// Ambient: files, config, benchmark
// =========================================================

static void testPuzzleFile() {
  Puzzle p;
  CHECK(parsePuzzleLine(std::string("wiki: ") + WIKIPEDIA, 1, &p));
  CHECK(p.getName() == "wiki");
  CHECK(p.getValue(0) == 5);
  CHECK(p.getValue(2) == 0);

  CHECK(parsePuzzleLine(ESCARGOT, 7, &p));
  CHECK(p.getName() == "line7");

  CHECK(!parsePuzzleLine("   ", 1, &p));
  CHECK(!parsePuzzleLine("# comment", 1, &p));
  CHECK_THROWS(parsePuzzleLine("short: 123", 3, &p), PuzzleFormatError);
  CHECK_THROWS(parsePuzzleLine(std::string("bad: x") + (WIKIPEDIA + 1), 4, &p), PuzzleFormatError);
  CHECK_THROWS(loadPuzzles("/nonexistent/sudopar/puzzles.txt"), PuzzleFormatError);
}

static void testRunConfig() {
  const char *defaults[] = { "sudopar", "p.txt" };
  RunConfig c = parseArgs(2, defaults);
  CHECK(c.problemsPath == "p.txt");
  CHECK(c.mode == SolveMode::Sequential);
  CHECK(!c.bench);
  CHECK(c.executions == DEFAULT_EXECUTIONS);

  const char *full[] = { "sudopar", "p.txt", "--mode=batch", "--bench", "--executions=3", "--solutions=s.txt", "--only=wiki" };
  c = parseArgs(7, full);
  CHECK(c.mode == SolveMode::Batch);
  CHECK(c.bench);
  CHECK(c.executions == 3);
  CHECK(c.solutionsPath == "s.txt");
  CHECK(c.only == "wiki");

  const char *badMode[] = { "sudopar", "p.txt", "--mode=fast" };
  CHECK_THROWS(parseArgs(3, badMode), std::invalid_argument);
  const char *badCount[] = { "sudopar", "p.txt", "--executions=0" };
  CHECK_THROWS(parseArgs(3, badCount), std::invalid_argument);
  const char *missing[] = { "sudopar", "--bench" };
  CHECK_THROWS(parseArgs(2, missing), std::invalid_argument);
}

static void testBenchmark() {
  int calls = 0;
  const double ms = bm([&calls]() { calls++; }, 5);
  CHECK(calls == 5);
  CHECK(ms >= 0.0);
  CHECK_THROWS(bm([]() {}, 0), std::invalid_argument);

  std::vector<Puzzle> puzzles;
  puzzles.push_back(Puzzle("wikipedia", WIKIPEDIA));
  const std::vector<BenchmarkResult> results = benchmarks(puzzles, 2);
  CHECK(results.size() == 1);
  CHECK(results[0].name == "wikipedia");
  CHECK(benchmarksSequential(puzzles, 2).size() == 1);
  CHECK(benchmarksBatch(puzzles, 2) >= 0.0);
}

int main() {
  runCase("cell candidates", testCellCandidates);
  runCase("transpose", testTranspose);
  runCase("block view", testBlockView);
  runCase("replace cell", testReplaceCell);
  runCase("fill", testFill);
  runCase("refine row", testRefineRow);
  runCase("duplicate given", testDuplicateGivenIsContradiction);
  runCase("refine fixpoint", testRefineFixpoint);
  runCase("refine parallel", testRefineParallelMatchesSequential);
  runCase("solved", testSolved);
  runCase("guess tie-break", testGuessTieBreak);
  runCase("hardness", testHardness);
  runCase("guesses order", testGuessesEasiestFirst);
  runCase("solve one", testSolveOne);
  runCase("solve known", testSolveKnownSolutions);
  runCase("solve empty/unsolvable", testSolveEmptyAndUnsolvable);
  runCase("c facade", testCFacade);
  runCase("batch", testBatch);
  runCase("batch fault", testBatchFaultRethrown);
  runCase("validator", testValidator);
  runCase("mailbox", testMailbox);
  runCase("task group ordering", testTaskGroupOrdering);
  runCase("task group failure", testTaskGroupFailure);
  runCase("puzzle file", testPuzzleFile);
  runCase("run config", testRunConfig);
  runCase("benchmark", testBenchmark);

  std::cout << "SUMMARY: checks=" << g_checks << " failed=" << g_failures << "\n";
  return g_failures == 0 ? 0 : 1;
}
