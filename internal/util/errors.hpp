#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace forecast::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

struct FieldError {
  std::string field;
  std::string message;
  std::string code;
};

// Delta rejected by the validation gate.
class ValidationFailed : public std::runtime_error {
 public:
  ValidationFailed(const std::string& msg, std::vector<FieldError> errors) : std::runtime_error(msg), errors_(std::move(errors)) {
  }

  const std::vector<FieldError>& Errors() const {
    return errors_;
  }

 private:
  std::vector<FieldError> errors_;
};

// A concurrent transaction committed first; the caller may retry.
class TransactionConflict : public std::runtime_error {
 public:
  explicit TransactionConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Archival backend could not store or read a batch.
class ArchivalError : public std::runtime_error {
 public:
  explicit ArchivalError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace forecast::util
