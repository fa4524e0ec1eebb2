#pragma once

#include <stdexcept>
#include <string>

namespace microbatch_server {
// =============================================================================
// Base class for all classifier-related exceptions
// =============================================================================

class ClassifierException : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// =============================================================================
// Specific exception types for common failure cases
// =============================================================================

/// Thrown by a predictor when a whole batch fails
class InferenceExecutionException : public ClassifierException {
 public:
  using ClassifierException::ClassifierException;
};

/// Thrown when loading the TorchScript model fails
class ModelLoadingException : public ClassifierException {
 public:
  using ClassifierException::ClassifierException;
};

/// Thrown by the dispatcher when no response arrived within the wait budget
class RequestTimeoutException : public ClassifierException {
 public:
  using ClassifierException::ClassifierException;
};

/// Thrown when the worker pool or dispatcher no longer accepts requests
class ServiceUnavailableException : public ClassifierException {
 public:
  using ClassifierException::ClassifierException;
};

/// Thrown when a completion handle already exists for a request id
class DuplicateRequestIdException : public ClassifierException {
 public:
  using ClassifierException::ClassifierException;
};

class InvalidConfigException : public ClassifierException {
 public:
  using ClassifierException::ClassifierException;
};

}  // namespace microbatch_server
