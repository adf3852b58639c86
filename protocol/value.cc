#include "value.hh"

#include <cassert>
#include <iomanip>

#include "util/error.hh"

namespace kvchain::protocol {

const char* name(enum value_kind kind) {
  static const char* types[] = {
      "null",
      "boolean",
      "integer",
      "floating",
      "string",
      "binary",
  };
  static_assert(std::size(types) == static_cast<int>(value_kind::num_of_kinds));
  assert(static_cast<uint8_t>(kind) < std::size(types));
  return types[static_cast<uint8_t>(kind)];
}

std::ostream& operator<<(std::ostream& os, const binary_object& b) {
  os << "binary[" << b.kind << ":";
  auto flags = os.flags();
  for (unsigned char c : b.bytes) {
    os << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
  }
  os.flags(flags);
  return os << "]";
}

void value::type_mismatch(enum value_kind expected) const {
  throw util::invalid_argument(
      "value", fmt::format("expected {}, actual {}", expected, kind()));
}

std::ostream& operator<<(std::ostream& os, const value& v) {
  std::visit(
      [&os](const auto& item) {
        using T = std::decay_t<decltype(item)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          os << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
          os << (item ? "true" : "false");
        } else {
          os << item;
        }
      },
      v._v);
  return os;
}

std::ostream& operator<<(std::ostream& os, const entry& e) {
  return os << "Entry(" << e.key << "," << e.val << ")";
}

std::vector<entry> to_entries(const entry_map& m) {
  std::vector<entry> entries;
  entries.reserve(m.size());
  for (const auto& [k, v] : m) {
    entries.push_back(entry{.key = k, .val = v});
  }
  return entries;
}

std::ostream& operator<<(std::ostream& os, const entry_map& m) {
  os << "{";
  bool first = true;
  for (const auto& [k, v] : m) {
    os << (first ? "" : ", ") << k << " -> " << v;
    first = false;
  }
  return os << "}";
}

std::ostream& operator<<(std::ostream& os, const std::vector<entry>& entries) {
  os << "[";
  bool first = true;
  for (const auto& e : entries) {
    os << (first ? "" : ", ") << e;
    first = false;
  }
  return os << "]";
}

}  // namespace kvchain::protocol
