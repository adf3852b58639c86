#pragma once

#include <fmt/ostream.h>

#include <compare>
#include <concepts>
#include <cstdint>
#include <map>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace kvchain::protocol {

enum class value_kind : uint8_t {
  null,
  boolean,
  integer,
  floating,
  string,
  binary,
  num_of_kinds,
};

const char* name(enum value_kind kind);
inline std::ostream& operator<<(std::ostream& os, value_kind kind) {
  return os << name(kind);
}

// the encoded form of a value, see protocol/serializer.hh
struct binary_object {
  value_kind kind = value_kind::null;
  std::string bytes;

  std::strong_ordering operator<=>(const binary_object&) const = default;
  bool operator==(const binary_object&) const = default;

  friend std::ostream& operator<<(std::ostream& os, const binary_object& b);
};

class value {
 public:
  value() = default;
  value(bool v) : _v(v) {}
  template <typename T>
    requires(std::integral<T> && !std::same_as<T, bool>)
  value(T v) : _v(static_cast<int64_t>(v)) {}
  value(double v) : _v(v) {}
  value(std::string v) : _v(std::move(v)) {}
  value(const char* v) : _v(std::string(v)) {}
  value(binary_object v) : _v(std::move(v)) {}

  enum value_kind kind() const noexcept {
    return static_cast<enum value_kind>(_v.index());
  }
  bool is_null() const noexcept { return kind() == value_kind::null; }

  template <typename T>
  bool is() const noexcept {
    return std::holds_alternative<T>(_v);
  }

  // throws util::invalid_argument if the value does not hold a T
  template <typename T>
  const T& as() const;

  template <typename T>
  const T* get_if() const noexcept {
    return std::get_if<T>(&_v);
  }

  bool operator==(const value& rhs) const = default;
  bool operator<(const value& rhs) const { return _v < rhs._v; }

  template <typename T>
  static constexpr enum value_kind kind_of() noexcept {
    if constexpr (std::same_as<T, bool>) {
      return value_kind::boolean;
    } else if constexpr (std::same_as<T, int64_t>) {
      return value_kind::integer;
    } else if constexpr (std::same_as<T, double>) {
      return value_kind::floating;
    } else if constexpr (std::same_as<T, std::string>) {
      return value_kind::string;
    } else if constexpr (std::same_as<T, binary_object>) {
      return value_kind::binary;
    } else {
      return value_kind::null;
    }
  }

  friend std::ostream& operator<<(std::ostream& os, const value& v);

 private:
  [[noreturn]] void type_mismatch(enum value_kind expected) const;

  std::variant<std::monostate, bool, int64_t, double, std::string, binary_object>
      _v;
};

template <typename T>
const T& value::as() const {
  if (auto* v = std::get_if<T>(&_v); v != nullptr) {
    return *v;
  }
  type_mismatch(kind_of<T>());
}

struct entry {
  value key;
  value val;

  bool operator==(const entry&) const = default;

  friend std::ostream& operator<<(std::ostream& os, const entry& e);
};

// the uniform result of every cache operation, write-only operations yield an
// empty map
using entry_map = std::map<value, value>;

std::vector<entry> to_entries(const entry_map& m);

std::ostream& operator<<(std::ostream& os, const entry_map& m);
std::ostream& operator<<(std::ostream& os, const std::vector<entry>& entries);

}  // namespace kvchain::protocol

template <>
struct fmt::formatter<kvchain::protocol::value_kind> : fmt::ostream_formatter {
};
template <>
struct fmt::formatter<kvchain::protocol::binary_object>
  : fmt::ostream_formatter {};
template <>
struct fmt::formatter<kvchain::protocol::value> : fmt::ostream_formatter {};
template <>
struct fmt::formatter<kvchain::protocol::entry> : fmt::ostream_formatter {};
