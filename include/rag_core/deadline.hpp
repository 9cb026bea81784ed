#pragma once

#include <algorithm>
#include <chrono>
#include <string>

#include "rag_core/errors.hpp"

namespace rag_core {

// Caller-supplied point in time after which work must stop. A default
// constructed Deadline never expires.
class Deadline {
 public:
  using Clock = std::chrono::steady_clock;

  Deadline() : at_(Clock::time_point::max()) {}
  explicit Deadline(Clock::time_point at) : at_(at) {}

  static Deadline none() {
    return Deadline();
  }
  static Deadline after(std::chrono::milliseconds budget) {
    return Deadline(Clock::now() + budget);
  }

  bool is_unbounded() const {
    return at_ == Clock::time_point::max();
  }
  bool expired() const {
    return !is_unbounded() && Clock::now() >= at_;
  }
  Clock::time_point time_point() const {
    return at_;
  }

  std::chrono::milliseconds remaining() const {
    if (is_unbounded()) {
      return std::chrono::milliseconds::max();
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(at_ - Clock::now());
    return std::max(left, std::chrono::milliseconds(0));
  }

  // Earlier of this deadline and now + budget.
  Clock::time_point bounded_by(std::chrono::milliseconds budget) const {
    return std::min(at_, Clock::now() + budget);
  }

  void throw_if_expired(const std::string &operation) const {
    if (expired()) {
      throw RetrievalTimeout(operation, "deadline expired");
    }
  }

 private:
  Clock::time_point at_;
};

}  // namespace rag_core
