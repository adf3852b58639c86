#include "cache.hh"

#include <cassert>
#include <iterator>

namespace kvchain::protocol {

const char* name(enum cache_atomicity atomicity) {
  static const char* types[] = {
      "ATOMIC",
      "TRANSACTIONAL",
  };
  static_assert(
      std::size(types) ==
      static_cast<int>(cache_atomicity::num_of_atomicity));
  assert(static_cast<uint8_t>(atomicity) < std::size(types));
  return types[static_cast<uint8_t>(atomicity)];
}

const char* name(enum cache_mode mode) {
  static const char* types[] = {
      "PARTITIONED",
      "REPLICATED",
      "LOCAL",
  };
  static_assert(std::size(types) == static_cast<int>(cache_mode::num_of_mode));
  assert(static_cast<uint8_t>(mode) < std::size(types));
  return types[static_cast<uint8_t>(mode)];
}

std::ostream& operator<<(std::ostream& os, const cache_config& cfg) {
  return os << "cache_config[name:" << cfg.name << ", backups:" << cfg.backups
            << ", atomicity:" << cfg.atomicity << ", mode:" << cfg.mode << "]";
}

const char* name(enum tx_concurrency concurrency) {
  static const char* types[] = {
      "OPTIMISTIC",
      "PESSIMISTIC",
  };
  static_assert(
      std::size(types) ==
      static_cast<int>(tx_concurrency::num_of_concurrency));
  assert(static_cast<uint8_t>(concurrency) < std::size(types));
  return types[static_cast<uint8_t>(concurrency)];
}

const char* name(enum tx_isolation isolation) {
  static const char* types[] = {
      "READ_COMMITTED",
      "REPEATABLE_READ",
      "SERIALIZABLE",
  };
  static_assert(
      std::size(types) == static_cast<int>(tx_isolation::num_of_isolation));
  assert(static_cast<uint8_t>(isolation) < std::size(types));
  return types[static_cast<uint8_t>(isolation)];
}

const char* name(enum tx_state state) {
  static const char* types[] = {
      "active",
      "committed",
      "rolled_back",
      "closed",
  };
  static_assert(std::size(types) == static_cast<int>(tx_state::num_of_state));
  assert(static_cast<uint8_t>(state) < std::size(types));
  return types[static_cast<uint8_t>(state)];
}

std::ostream& operator<<(std::ostream& os, const tx_options& opts) {
  return os << "tx_options[concurrency:" << opts.concurrency
            << ", isolation:" << opts.isolation
            << ", timeout:" << opts.timeout.count() << "ms"
            << ", size:" << opts.size << "]";
}

}  // namespace kvchain::protocol
