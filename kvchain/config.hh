#pragma once

#include <stdint.h>

#include <istream>
#include <memory>
#include <ostream>
#include <seastar/core/future.hh>
#include <string>

#include "protocol/cache.hh"

namespace kvchain {

enum class check_policy : uint8_t {
  // evaluate every check and report all failures
  aggregate,
  // stop at the first failed check
  strict,
  num_of_policy,
};

const char* name(enum check_policy policy);
std::ostream& operator<<(std::ostream& os, check_policy policy);

// config is shared among all shards
struct config {
  // how the checks declared by one action are evaluated
  check_policy check = check_policy::aggregate;

  // exit_on_failure stops the chain of a session at its first failed action.
  // When disabled, the chain continues with the session marked as failed.
  // Scoped transactions are closed in both cases.
  bool exit_on_failure = true;

  // shared_client makes the runner open one client for all sessions and seed
  // it into every session before the scenario starts.
  bool shared_client = true;

  // the number of sessions started by the runner
  uint64_t users = 1;

  // the max number of sessions running at the same time
  uint64_t concurrency = 64;

  // default options of the transactions begun without explicit options
  protocol::tx_concurrency tx_concurrency =
      protocol::tx_concurrency::pessimistic;
  protocol::tx_isolation tx_isolation = protocol::tx_isolation::repeatable_read;
  uint64_t tx_timeout_ms = 0;
  uint64_t tx_size = 0;

  protocol::tx_options default_tx_options() const;

  void validate() const;

  // initialize the config on shard 0 with default value
  static void initialize();
  // initialize the config on shard 0 with given value
  static void initialize(const config& init);
  // broadcast the shard 0's config to all shards
  static seastar::future<> broadcast();
  static config read_from(std::istream& input);
  static const config& shard();
  static config& mutable_shard();

 private:
  static inline thread_local std::unique_ptr<config> _config;
};

std::ostream& operator<<(std::ostream& os, const config& cfg);

}  // namespace kvchain

template <>
struct fmt::formatter<kvchain::check_policy> : fmt::ostream_formatter {};
template <>
struct fmt::formatter<kvchain::config> : fmt::ostream_formatter {};
