#include "internal/db/api/result.hpp"

#include <utility>

#include "internal/util/errors.hpp"

namespace scd::db {

void ThrowIfError(const Result& result, const std::string& context, std::vector<std::string> keys) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::Busy:
      throw util::StorageUnavailable(message);
    case ErrorCode::Conflict:
    case ErrorCode::NotFound:
    case ErrorCode::AlreadyExists:
    case ErrorCode::ConstraintViolation:
      throw util::TransactionConflict(message, std::move(keys));
    default:
      throw util::StorageFailure(message);
  }
}

} // namespace scd::db
