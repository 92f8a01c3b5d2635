#ifndef MESSAGE_H
#define MESSAGE_H

#include <cstdint>
#include <exception>

// one message = the outcome of one task: a result or the error it raised
template <typename Result>
struct Message
{
  Message() : taskIdx(0), result(), error() { }

  Message(uint32_t taskIdx, const Result &result) : taskIdx(taskIdx), result(result), error() { }

  Message(uint32_t taskIdx, std::exception_ptr error) : taskIdx(taskIdx), result(), error(error) { }

  uint32_t taskIdx;
  Result result;
  std::exception_ptr error;

  bool failed() const {
    return error != nullptr;
  }

  // a task answers once, so its index identifies the message
  uint32_t getMessageId() const {
    return taskIdx;
  }
};

#endif // MESSAGE_H
