#include "rag_core/async/task_queue.hpp"

#include "rag_core/errors.hpp"

namespace rag_core::async {

void TaskQueue::push(ITaskPtr task) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (closed_) {
      throw RagError("submit_task", "worker pool is stopped");
    }
    tasks_.push_back(std::move(task));
  }
  cv_.notify_one();
}

ITaskPtr TaskQueue::pop() {
  std::unique_lock<std::mutex> lock(mtx_);
  cv_.wait(lock, [this] { return closed_ || !tasks_.empty(); });
  if (closed_) {
    return nullptr;
  }
  ITaskPtr task = std::move(tasks_.front());
  tasks_.pop_front();
  return task;
}

void TaskQueue::close() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    closed_ = true;
    tasks_.clear();
  }
  cv_.notify_all();
}

void TaskQueue::reopen() {
  std::lock_guard<std::mutex> lock(mtx_);
  closed_ = false;
}

size_t TaskQueue::size() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return tasks_.size();
}

}  // namespace rag_core::async
