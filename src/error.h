#pragma once
// error.h -- Failure types raised by the backends and the navigation core.

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace perftree {

enum class QueryFailure : std::uint8_t {
  Transport = 0,
  Protocol,
  Timeout,
  Cancelled
};

std::string_view query_failure_name(QueryFailure kind);

/**
 * A backend could not answer a perft query. The navigation state is never
 * touched by a failed query; callers report the message and carry on.
 */
class QueryError : public std::runtime_error {
 public:
  QueryError(QueryFailure kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  [[nodiscard]] QueryFailure kind() const noexcept { return kind_; }

 private:
  QueryFailure kind_;
};

// Malformed user request detected by the core rather than the front end.
class UsageError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace perftree
