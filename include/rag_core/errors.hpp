#pragma once

#include <exception>
#include <string>

namespace rag_core {

// Base of every error raised by the retrieval core. Carries the operation that
// failed so callers can log without re-deriving context.
class RagError : public std::exception {
 public:
  RagError(const std::string &operation, const std::string &message)
      : operation_(operation), message_(message), what_(operation + " failed: " + message) {}

  const char *what() const noexcept override {
    return what_.c_str();
  }

  const std::string &operation() const {
    return operation_;
  }
  const std::string &message() const {
    return message_;
  }

 private:
  std::string operation_;
  std::string message_;
  std::string what_;
};

// Invalid or missing configuration. Fatal at startup, never retried.
class ConfigError : public RagError {
 public:
  using RagError::RagError;
};

class EmbeddingProviderError : public RagError {
 public:
  EmbeddingProviderError(const std::string &operation, const std::string &message,
                         bool transient = false)
      : RagError(operation, message), transient_(transient) {}

  // Network failures and throttling; only these are retried.
  bool is_transient() const {
    return transient_;
  }

 private:
  bool transient_;
};

class VectorIndexError : public RagError {
 public:
  using RagError::RagError;
};

// No complete index pair is published. Returned immediately, never waited on.
class IndexNotReady : public RagError {
 public:
  using RagError::RagError;
};

class RetrievalTimeout : public RagError {
 public:
  using RagError::RagError;
};

class RetrievalError : public RagError {
 public:
  using RagError::RagError;
};

class InitError : public RagError {
 public:
  using RagError::RagError;
};

}  // namespace rag_core
