#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace scd::util {

/*
  Central error types.

  Every failure that can end a pass is one of these. The orchestrator
  reports Kind() in the run summary; nothing below the orchestrator
  catches them.
*/

enum class ErrorKind {
  kInvalidConfiguration,
  kMissingAttribute,
  kDuplicateKey,
  kInvariantViolation,
  kStorageUnavailable,
  kTransactionConflict,
  kStorageFailure,
};

std::string_view ErrorKindName(ErrorKind kind);

class Error : public std::runtime_error {
 public:
  Error(ErrorKind kind, const std::string& msg, std::vector<std::string> keys = {})
      : std::runtime_error(msg), kind_(kind), keys_(std::move(keys)) {
  }

  ErrorKind Kind() const {
    return kind_;
  }

  // Business keys implicated in the failure, if any.
  const std::vector<std::string>& Keys() const {
    return keys_;
  }

 private:
  ErrorKind                kind_;
  std::vector<std::string> keys_;
};

class InvalidConfiguration : public Error {
 public:
  explicit InvalidConfiguration(const std::string& msg) : Error(ErrorKind::kInvalidConfiguration, msg) {
  }
};

class MissingAttribute : public Error {
 public:
  explicit MissingAttribute(const std::string& msg, std::vector<std::string> keys = {})
      : Error(ErrorKind::kMissingAttribute, msg, std::move(keys)) {
  }
};

class DuplicateKey : public Error {
 public:
  DuplicateKey(const std::string& msg, std::vector<std::string> keys) : Error(ErrorKind::kDuplicateKey, msg, std::move(keys)) {
  }
};

class InvariantViolation : public Error {
 public:
  explicit InvariantViolation(const std::string& msg, std::vector<std::string> keys = {})
      : Error(ErrorKind::kInvariantViolation, msg, std::move(keys)) {
  }
};

// Transient; the orchestrator may retry.
class StorageUnavailable : public Error {
 public:
  explicit StorageUnavailable(const std::string& msg) : Error(ErrorKind::kStorageUnavailable, msg) {
  }
};

class TransactionConflict : public Error {
 public:
  explicit TransactionConflict(const std::string& msg, std::vector<std::string> keys = {})
      : Error(ErrorKind::kTransactionConflict, msg, std::move(keys)) {
  }
};

class StorageFailure : public Error {
 public:
  explicit StorageFailure(const std::string& msg) : Error(ErrorKind::kStorageFailure, msg) {
  }
};

} // namespace scd::util
