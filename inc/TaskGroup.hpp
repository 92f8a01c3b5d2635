#ifndef TASK_GROUP_H
#define TASK_GROUP_H

#include <cstddef>
#include <cstdint>
#include <exception>
#include <thread>
#include <vector>
#include "Mailbox.hpp"

// =========================================================
// TaskGroup: fan out one thread per task, fan in by task index
// =========================================================
//
// Each task runs on a snapshot captured at launch and posts exactly one
// message (its result or its error) to the group's mailbox.
// join() is a count-down barrier: it receives one message per launched task,
// places each result at its launch index whatever the arrival order, and
// rethrows the first error observed once every task has finished.
// There is no cancellation: siblings of a failed task run to completion.
template <typename Result>
class TaskGroup
{
public:
  explicit TaskGroup(std::size_t expected) : completedTasks(0) {
    workers.reserve(expected);
  }

  ~TaskGroup() {
    joinThreads();
  }

  TaskGroup(const TaskGroup &) = delete;
  TaskGroup &operator=(const TaskGroup &) = delete;

  // Task: callable returning Result
  template <typename Task>
  void launch(Task task) {
    const uint32_t idx = (uint32_t)workers.size();
    Mailbox<Result> *box = &mailbox;
    workers.emplace_back([box, idx, task]() {
      std::exception_ptr error;
      try {
        box->push(Message<Result>(idx, task()));
        return;
      } catch (...) {
        error = std::current_exception();
      }
      // forwarded to the coordinator, which rethrows it from join()
      box->push(Message<Result>(idx, error));
    });
  }

  std::vector<Result> join() {
    std::vector<Result> results(workers.size());
    std::exception_ptr firstError;

    for (std::size_t pending = workers.size() - completedTasks; pending > 0; pending--) {
      const Message<Result> msg = mailbox.receive();
      completedTasks++;
      if (msg.failed()) {
        if (!firstError) {
          firstError = msg.error;
        }
        continue;
      }
      results[msg.taskIdx] = msg.result;
    }

    joinThreads();

    if (firstError) {
      std::rethrow_exception(firstError);
    }
    return results;
  }

  std::size_t launched() const {
    return workers.size();
  }

  std::size_t completions() const {
    return completedTasks;
  }

private:
  Mailbox<Result> mailbox;
  std::vector<std::thread> workers;
  std::size_t completedTasks;

  void joinThreads() {
    for (std::thread &worker : workers) {
      if (worker.joinable()) {
        worker.join();
      }
    }
  }
};

#endif // TASK_GROUP_H
