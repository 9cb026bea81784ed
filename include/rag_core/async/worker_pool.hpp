#pragma once

#include <future>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

#include "rag_core/async/ITask.hpp"
#include "rag_core/async/task_queue.hpp"
#include "rag_core/async/worker.hpp"

namespace rag_core::async {

/**
 * @class WorkerPool
 * @brief Owns a fixed set of Worker threads and the queue they drain.
 *
 * Tasks submitted before start() wait in the queue. stop() discards pending
 * tasks (their futures report broken_promise) and joins every worker.
 */
class WorkerPool {
 public:
  explicit WorkerPool(size_t num_threads);
  ~WorkerPool();

  void start();
  void stop();

  bool is_running() const {
    return m_is_running;
  }
  size_t size() const {
    return m_workers.size();
  }
  size_t pending() const {
    return m_queue.size();
  }

  template <typename F>
  auto submit(F &&fn, const char *type = "packaged")
      -> std::future<std::invoke_result_t<std::decay_t<F>>> {
    using R = std::invoke_result_t<std::decay_t<F>>;
    auto task = std::make_unique<PackagedTask<R>>(std::forward<F>(fn), type);
    auto future = task->get_future();
    m_queue.push(std::move(task));
    return future;
  }

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;
  WorkerPool(WorkerPool &&) = delete;
  WorkerPool &operator=(WorkerPool &&) = delete;

 private:
  TaskQueue m_queue;
  std::vector<std::unique_ptr<Worker>> m_workers;
  bool m_is_running = false;
};

}  // namespace rag_core::async
