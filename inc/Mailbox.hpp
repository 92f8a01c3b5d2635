#ifndef MAILBOX_H
#define MAILBOX_H

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <queue>
#include <set>
#include "Message.hpp"

// =========================================================
// Mailbox (thread-safe, accepts one message per task index)
// =========================================================

template <typename Result>
class Mailbox
{
public:
  Mailbox() = default;

  Mailbox(const Mailbox &) = delete;
  Mailbox &operator=(const Mailbox &) = delete;

  // push only if no message with this id was ever delivered;
  // a task answers once, later answers are rejected
  bool push(const Message<Result> &x) {
    {
      std::lock_guard<std::mutex> lock(m);
      if (s.find(x.getMessageId()) != s.end()) {
        return false;
      }
      q.push(x);
      s.insert(x.getMessageId());
    }
    cv.notify_one();
    return true;
  }

  // blocks until a message is available; no timeout
  Message<Result> receive() {
    std::unique_lock<std::mutex> lock(m);
    cv.wait(lock, [this]() { return !q.empty(); });
    Message<Result> front = q.front();
    q.pop();
    return front;
  }

  bool delivered(uint32_t taskIdx) const {
    std::lock_guard<std::mutex> lock(m);
    return s.find(taskIdx) != s.end();
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(m);
    return q.size();
  }

  bool empty() const {
    std::lock_guard<std::mutex> lock(m);
    return q.empty();
  }

private:
  mutable std::mutex m;
  std::condition_variable cv;
  std::queue<Message<Result> > q;
  std::set<uint32_t> s;
};

#endif // MAILBOX_H
