#pragma once

#include <atomic>
#include <thread>

#include "rag_core/async/task_queue.hpp"

namespace rag_core::async {

/**
 * @class Worker
 * @brief A single background thread that executes tasks from a TaskQueue.
 *
 * Managed by a WorkerPool. Non-copyable and non-movable so that ownership of
 * the underlying thread stays with one object.
 */
class Worker {
 public:
  Worker(int worker_id, TaskQueue &queue);

  // Stops and joins the thread.
  ~Worker();

  /**
   * @brief Starts the processing loop in a new thread.
   * @throws RagError if the worker is already running.
   */
  void start();

  /**
   * @brief Signals the loop to exit after its current task. Does not block.
   */
  void stop();

  // Waits for the thread to exit. Call stop() and close the queue first.
  void join();

  Worker(const Worker &) = delete;
  Worker &operator=(const Worker &) = delete;
  Worker(Worker &&) = delete;
  Worker &operator=(Worker &&) = delete;

 private:
  void run_loop();

  int worker_id_;
  TaskQueue &queue_;
  std::atomic<bool> should_stop_{false};
  std::thread thread_;
};

}  // namespace rag_core::async
