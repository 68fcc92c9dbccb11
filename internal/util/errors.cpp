#include "errors.hpp"

namespace scd::util {

std::string_view ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kInvalidConfiguration:
      return "InvalidConfiguration";
    case ErrorKind::kMissingAttribute:
      return "MissingAttribute";
    case ErrorKind::kDuplicateKey:
      return "DuplicateKey";
    case ErrorKind::kInvariantViolation:
      return "InvariantViolation";
    case ErrorKind::kStorageUnavailable:
      return "StorageUnavailable";
    case ErrorKind::kTransactionConflict:
      return "TransactionConflict";
    case ErrorKind::kStorageFailure:
      return "StorageFailure";
  }
  return "Unknown";
}

} // namespace scd::util
