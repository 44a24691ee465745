#include "result.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace market::db {

void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::Conflict:
      throw util::InvalidState(message);
    case ErrorCode::Busy:
      throw util::Unavailable(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace market::db
