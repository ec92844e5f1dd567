#include "error.h"

namespace perftree {

std::string_view query_failure_name(QueryFailure kind) {
  switch (kind) {
    case QueryFailure::Transport:
      return "transport";
    case QueryFailure::Protocol:
      return "protocol";
    case QueryFailure::Timeout:
      return "timeout";
    case QueryFailure::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

}  // namespace perftree
