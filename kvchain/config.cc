#include "config.hh"

#include <yaml-cpp/yaml.h>

#include <seastar/core/smp.hh>

#include "util/error.hh"

namespace {

template <typename Enum>
Enum parse_name(const YAML::Node& node, std::string_view key, Enum last) {
  auto str = node.as<std::string>();
  for (uint8_t i = 0; i < static_cast<uint8_t>(last); ++i) {
    auto e = static_cast<Enum>(i);
    // found by argument dependent lookup
    if (str == name(e)) {
      return e;
    }
  }
  throw kvchain::util::configuration_error(key, "unknown value " + str);
}

}  // namespace

namespace YAML {

template <>
struct convert<kvchain::config> {
  static Node encode(const kvchain::config& cfg) {
    Node node;
    node["check_policy"] = kvchain::name(cfg.check);
    node["exit_on_failure"] = cfg.exit_on_failure;
    node["shared_client"] = cfg.shared_client;
    node["users"] = cfg.users;
    node["concurrency"] = cfg.concurrency;
    node["tx_concurrency"] = kvchain::protocol::name(cfg.tx_concurrency);
    node["tx_isolation"] = kvchain::protocol::name(cfg.tx_isolation);
    node["tx_timeout_ms"] = cfg.tx_timeout_ms;
    node["tx_size"] = cfg.tx_size;
    return node;
  }
  static bool decode(const Node& node, kvchain::config& cfg) {
    using namespace kvchain::protocol;
    if (node["check_policy"]) {
      cfg.check = parse_name(
          node["check_policy"],
          "check_policy",
          kvchain::check_policy::num_of_policy);
    }
    if (node["exit_on_failure"]) {
      cfg.exit_on_failure = node["exit_on_failure"].as<bool>();
    }
    if (node["shared_client"]) {
      cfg.shared_client = node["shared_client"].as<bool>();
    }
    if (node["users"]) {
      cfg.users = node["users"].as<uint64_t>();
    }
    if (node["concurrency"]) {
      cfg.concurrency = node["concurrency"].as<uint64_t>();
    }
    if (node["tx_concurrency"]) {
      cfg.tx_concurrency = parse_name(
          node["tx_concurrency"],
          "tx_concurrency",
          tx_concurrency::num_of_concurrency);
    }
    if (node["tx_isolation"]) {
      cfg.tx_isolation = parse_name(
          node["tx_isolation"], "tx_isolation", tx_isolation::num_of_isolation);
    }
    if (node["tx_timeout_ms"]) {
      cfg.tx_timeout_ms = node["tx_timeout_ms"].as<uint64_t>();
    }
    if (node["tx_size"]) {
      cfg.tx_size = node["tx_size"].as<uint64_t>();
    }
    return true;
  }
};

}  // namespace YAML

namespace kvchain {

using namespace seastar;

const char* name(enum check_policy policy) {
  static const char* types[] = {
      "aggregate",
      "strict",
  };
  static_assert(
      std::size(types) == static_cast<int>(check_policy::num_of_policy));
  return types[static_cast<uint8_t>(policy)];
}

std::ostream& operator<<(std::ostream& os, check_policy policy) {
  return os << name(policy);
}

protocol::tx_options config::default_tx_options() const {
  return protocol::tx_options{
      .concurrency = tx_concurrency,
      .isolation = tx_isolation,
      .timeout = std::chrono::milliseconds(tx_timeout_ms),
      .size = static_cast<uint32_t>(tx_size),
  };
}

void config::validate() const {
  if (users == 0) {
    throw util::configuration_error("users", "invalid");
  }
  if (concurrency == 0) {
    throw util::configuration_error("concurrency", "invalid");
  }
  if (tx_size > UINT32_MAX) {
    throw util::configuration_error("tx_size", "too large");
  }
}

void config::initialize() { initialize({}); }

void config::initialize(const config& init) {
  if (this_shard_id() != 0) {
    throw util::configuration_error("config", "must be initialized on shard 0");
  }
  if (_config) {
    throw util::configuration_error("config", "already initialized");
  }
  init.validate();
  _config = std::make_unique<config>(init);
}

config config::read_from(std::istream& input) {
  try {
    return YAML::Load(input).as<config>();
  } catch (const YAML::Exception& ex) {
    throw util::configuration_error("yaml", ex.what());
  }
}

future<> config::broadcast() {
  if (!_config) {
    throw util::configuration_error("config", "not initialized");
  }
  return smp::invoke_on_all([&cfg = std::as_const(*_config)] {
    if (this_shard_id() != 0) {
      _config = std::make_unique<config>(cfg);
    }
    return make_ready_future<>();
  });
}

const config& config::shard() {
  if (!_config) [[unlikely]] {
    throw util::configuration_error("config", "not initialized");
  }
  return *_config;
}

config& config::mutable_shard() {
  if (!_config) [[unlikely]] {
    throw util::configuration_error("config", "not initialized");
  }
  return *_config;
}

std::ostream& operator<<(std::ostream& os, const config& cfg) {
  os << "check_policy: " << cfg.check << ", "
     << "exit_on_failure: " << cfg.exit_on_failure << ", "
     << "shared_client: " << cfg.shared_client << ", "
     << "users: " << cfg.users << ", "
     << "concurrency: " << cfg.concurrency << ", "
     << "tx_concurrency: " << cfg.tx_concurrency << ", "
     << "tx_isolation: " << cfg.tx_isolation << ", "
     << "tx_timeout_ms: " << cfg.tx_timeout_ms << ", "
     << "tx_size: " << cfg.tx_size;
  return os;
}

}  // namespace kvchain
