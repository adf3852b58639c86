#include "serializer.hh"

#include <bit>
#include <seastar/core/byteorder.hh>

#include "util/error.hh"

namespace kvchain::protocol {

namespace {

std::string fixed64(uint64_t v) {
  std::string bytes(sizeof(uint64_t), '\0');
  seastar::write_le<uint64_t>(bytes.data(), v);
  return bytes;
}

uint64_t fixed64(const binary_object& b) {
  if (b.bytes.size() != sizeof(uint64_t)) [[unlikely]] {
    throw util::serialization_error(name(b.kind));
  }
  return seastar::read_le<uint64_t>(b.bytes.data());
}

}  // namespace

binary_object to_binary(const value& v) {
  switch (v.kind()) {
    case value_kind::null:
      return binary_object{.kind = value_kind::null};
    case value_kind::boolean:
      return binary_object{
          .kind = value_kind::boolean,
          .bytes = std::string(1, v.as<bool>() ? '\1' : '\0')};
    case value_kind::integer:
      return binary_object{
          .kind = value_kind::integer,
          .bytes = fixed64(static_cast<uint64_t>(v.as<int64_t>()))};
    case value_kind::floating:
      return binary_object{
          .kind = value_kind::floating,
          .bytes = fixed64(std::bit_cast<uint64_t>(v.as<double>()))};
    case value_kind::string:
      return binary_object{
          .kind = value_kind::string, .bytes = v.as<std::string>()};
    case value_kind::binary:
      return v.as<binary_object>();
    default:
      throw util::serialization_error(name(v.kind()));
  }
}

value from_binary(const binary_object& b) {
  switch (b.kind) {
    case value_kind::null:
      if (!b.bytes.empty()) [[unlikely]] {
        throw util::serialization_error(name(b.kind));
      }
      return value{};
    case value_kind::boolean:
      if (b.bytes.size() != 1) [[unlikely]] {
        throw util::serialization_error(name(b.kind));
      }
      return value{b.bytes[0] != '\0'};
    case value_kind::integer:
      return value{static_cast<int64_t>(fixed64(b))};
    case value_kind::floating:
      return value{std::bit_cast<double>(fixed64(b))};
    case value_kind::string:
      return value{b.bytes};
    default:
      throw util::serialization_error(name(b.kind));
  }
}

value to_binary_value(const value& v) {
  if (v.is_null()) {
    return v;
  }
  return value{to_binary(v)};
}

value from_binary_value(const value& v) {
  if (const auto* b = v.get_if<binary_object>(); b != nullptr) {
    return from_binary(*b);
  }
  return v;
}

entry_map to_binary(const entry_map& m) {
  entry_map encoded;
  for (const auto& [k, v] : m) {
    encoded.emplace(k, to_binary_value(v));
  }
  return encoded;
}

entry_map from_binary(const entry_map& m) {
  entry_map decoded;
  for (const auto& [k, v] : m) {
    decoded.emplace(k, from_binary_value(v));
  }
  return decoded;
}

}  // namespace kvchain::protocol
