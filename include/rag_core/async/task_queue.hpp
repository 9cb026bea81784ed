#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>

#include "rag_core/async/ITask.hpp"

namespace rag_core::async {

// FIFO of pending tasks shared by the workers of one pool.
class TaskQueue {
 public:
  // Throws RagError once the queue is closed.
  void push(ITaskPtr task);

  // Blocks until a task is available. Returns nullptr once closed.
  ITaskPtr pop();

  // Wakes every waiter; tasks still queued are discarded.
  void close();
  void reopen();

  size_t size() const;

 private:
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::deque<ITaskPtr> tasks_;
  bool closed_ = false;
};

}  // namespace rag_core::async
