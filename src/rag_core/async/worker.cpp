#include "rag_core/async/worker.hpp"

#include <iostream>

#include "rag_core/errors.hpp"

namespace rag_core::async {

Worker::Worker(int worker_id, TaskQueue &queue) : worker_id_(worker_id), queue_(queue) {}

Worker::~Worker() {
  stop();
  join();
}

void Worker::start() {
  if (thread_.joinable()) {
    throw RagError("start_worker", "worker " + std::to_string(worker_id_) + " is already running");
  }
  should_stop_.store(false);
  thread_ = std::thread(&Worker::run_loop, this);
}

void Worker::stop() {
  should_stop_.store(true);
}

void Worker::join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

void Worker::run_loop() {
  std::cout << "Worker [" << worker_id_ << "] starting run loop." << std::endl;

  while (!should_stop_.load()) {
    ITaskPtr task = queue_.pop();
    if (!task) {
      break;
    }
    // Packaged tasks report failures through their futures; anything that
    // escapes here is a bug in a task type.
    try {
      task->execute();
    } catch (const std::exception &e) {
      std::cerr << "Worker [" << worker_id_ << "] ERROR in " << task->get_type()
                << " task: " << e.what() << std::endl;
    }
  }
  std::cout << "Worker [" << worker_id_ << "] run loop terminated." << std::endl;
}

}  // namespace rag_core::async
