#include <cstddef>
#include <cstdint>
#include <string_view>

#include "error.h"
#include "script_engine.h"

extern "C" int LLVMFuzzerTestOneInput(const std::uint8_t* data, std::size_t size) {
  if (!data || size > 8192) {
    return 0;
  }
  const std::string_view text(reinterpret_cast<const char*>(data), size);
  try {
    const perftree::PerftReport report = perftree::parse_script_output(text);
    (void)report;
  } catch (const perftree::QueryError& ex) {
    if (ex.kind() != perftree::QueryFailure::Protocol) {
      __builtin_trap();
    }
  }
  return 0;
}
