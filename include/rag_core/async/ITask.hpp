#pragma once

#include <future>
#include <memory>
#include <utility>

namespace rag_core::async {

class ITask {
 public:
  virtual ~ITask() = default;

  virtual void execute() = 0;

  virtual const char *get_type() const = 0;
};

using ITaskPtr = std::unique_ptr<ITask>;

// Runs a callable and delivers its result, or its exception, through a future.
template <typename R>
class PackagedTask : public ITask {
 public:
  template <typename F>
  explicit PackagedTask(F &&fn, const char *type = "packaged")
      : task_(std::forward<F>(fn)), type_(type) {}

  void execute() override {
    task_();
  }

  const char *get_type() const override {
    return type_;
  }

  std::future<R> get_future() {
    return task_.get_future();
  }

 private:
  std::packaged_task<R()> task_;
  const char *type_;
};

}  // namespace rag_core::async
