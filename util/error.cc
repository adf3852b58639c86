#include "error.hh"

#include <iterator>

namespace kvchain::util {

std::string_view status_string(enum code e) {
  static std::string_view s[] = {
      "ok",
      "panic",
      "configuration",
      "serialization",
      "invalid_argument",
      "no_client",
      "async_conflict",
      "cache_not_found",
      "operation",
      "transaction",
      "check",
      "closed",
      "unknown"};
  static_assert(std::size(s) == static_cast<int>(code::num_of_codes));
  return s[static_cast<uint8_t>(e)];
}

}  // namespace kvchain::util
