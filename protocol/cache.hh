#pragma once

#include <fmt/ostream.h>

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>

namespace kvchain::protocol {

enum class cache_atomicity : uint8_t {
  atomic,
  transactional,
  num_of_atomicity,
};

const char* name(enum cache_atomicity atomicity);
inline std::ostream& operator<<(std::ostream& os, cache_atomicity atomicity) {
  return os << name(atomicity);
}

enum class cache_mode : uint8_t {
  partitioned,
  replicated,
  local,
  num_of_mode,
};

const char* name(enum cache_mode mode);
inline std::ostream& operator<<(std::ostream& os, cache_mode mode) {
  return os << name(mode);
}

struct cache_config {
  std::string name;
  uint32_t backups = 0;
  cache_atomicity atomicity = cache_atomicity::atomic;
  cache_mode mode = cache_mode::partitioned;

  friend std::ostream& operator<<(std::ostream& os, const cache_config& cfg);
};

enum class tx_concurrency : uint8_t {
  optimistic,
  pessimistic,
  num_of_concurrency,
};

const char* name(enum tx_concurrency concurrency);
inline std::ostream& operator<<(std::ostream& os, tx_concurrency c) {
  return os << name(c);
}

enum class tx_isolation : uint8_t {
  read_committed,
  repeatable_read,
  serializable,
  num_of_isolation,
};

const char* name(enum tx_isolation isolation);
inline std::ostream& operator<<(std::ostream& os, tx_isolation i) {
  return os << name(i);
}

// a begun transaction leaves active by exactly one terminal transition, closing
// a committed or rolled back transaction only releases it
enum class tx_state : uint8_t {
  active,
  committed,
  rolled_back,
  closed,
  num_of_state,
};

const char* name(enum tx_state state);
inline std::ostream& operator<<(std::ostream& os, tx_state state) {
  return os << name(state);
}

struct tx_options {
  tx_concurrency concurrency = tx_concurrency::pessimistic;
  tx_isolation isolation = tx_isolation::repeatable_read;
  // 0 means no timeout
  std::chrono::milliseconds timeout{0};
  // expected number of entries touched, 0 means unknown
  uint32_t size = 0;

  friend std::ostream& operator<<(std::ostream& os, const tx_options& opts);
};

}  // namespace kvchain::protocol

template <>
struct fmt::formatter<kvchain::protocol::cache_atomicity>
  : fmt::ostream_formatter {};
template <>
struct fmt::formatter<kvchain::protocol::cache_mode> : fmt::ostream_formatter {
};
template <>
struct fmt::formatter<kvchain::protocol::cache_config>
  : fmt::ostream_formatter {};
template <>
struct fmt::formatter<kvchain::protocol::tx_concurrency>
  : fmt::ostream_formatter {};
template <>
struct fmt::formatter<kvchain::protocol::tx_isolation>
  : fmt::ostream_formatter {};
template <>
struct fmt::formatter<kvchain::protocol::tx_state> : fmt::ostream_formatter {};
template <>
struct fmt::formatter<kvchain::protocol::tx_options> : fmt::ostream_formatter {
};
