#include "kvchain/config.hh"

#include <sstream>

#include "test/base.hh"
#include "util/error.hh"

namespace {

using namespace kvchain;
using namespace kvchain::protocol;

class config_test : public ::testing::Test {};

TEST_F(config_test, read_all_keys) {
  std::stringstream ss;
  ss << "check_policy: strict\n"
        "exit_on_failure: false\n"
        "shared_client: false\n"
        "users: 16\n"
        "concurrency: 4\n"
        "tx_concurrency: OPTIMISTIC\n"
        "tx_isolation: SERIALIZABLE\n"
        "tx_timeout_ms: 1500\n"
        "tx_size: 8\n";
  auto cfg = config::read_from(ss);
  EXPECT_EQ(cfg.check, check_policy::strict);
  EXPECT_FALSE(cfg.exit_on_failure);
  EXPECT_FALSE(cfg.shared_client);
  EXPECT_EQ(cfg.users, 16);
  EXPECT_EQ(cfg.concurrency, 4);
  EXPECT_EQ(cfg.tx_concurrency, tx_concurrency::optimistic);
  EXPECT_EQ(cfg.tx_isolation, tx_isolation::serializable);
  EXPECT_EQ(cfg.tx_timeout_ms, 1500);
  EXPECT_EQ(cfg.tx_size, 8);
  EXPECT_NO_THROW(cfg.validate());

  auto opts = cfg.default_tx_options();
  EXPECT_EQ(opts.concurrency, tx_concurrency::optimistic);
  EXPECT_EQ(opts.isolation, tx_isolation::serializable);
  EXPECT_EQ(opts.timeout, std::chrono::milliseconds(1500));
  EXPECT_EQ(opts.size, 8);
}

TEST_F(config_test, missing_keys_keep_defaults) {
  std::stringstream ss;
  ss << "users: 2\n";
  auto cfg = config::read_from(ss);
  config defaults;
  EXPECT_EQ(cfg.users, 2);
  EXPECT_EQ(cfg.check, defaults.check);
  EXPECT_EQ(cfg.exit_on_failure, defaults.exit_on_failure);
  EXPECT_EQ(cfg.shared_client, defaults.shared_client);
  EXPECT_EQ(cfg.concurrency, defaults.concurrency);
  EXPECT_EQ(cfg.tx_concurrency, tx_concurrency::pessimistic);
  EXPECT_EQ(cfg.tx_isolation, tx_isolation::repeatable_read);
  EXPECT_EQ(cfg.default_tx_options().timeout.count(), 0);
}

TEST_F(config_test, unknown_enum_name) {
  std::stringstream ss;
  ss << "tx_isolation: SNAPSHOT\n";
  EXPECT_THROW(config::read_from(ss), kvchain::util::configuration_error);
}

TEST_F(config_test, malformed_value) {
  std::stringstream ss;
  ss << "users: many\n";
  EXPECT_THROW(config::read_from(ss), kvchain::util::configuration_error);
}

TEST_F(config_test, validate) {
  config cfg;
  cfg.users = 0;
  EXPECT_THROW(cfg.validate(), kvchain::util::configuration_error);
  cfg.users = 1;
  cfg.concurrency = 0;
  EXPECT_THROW(cfg.validate(), kvchain::util::configuration_error);
  cfg.concurrency = 1;
  cfg.tx_size = uint64_t{UINT32_MAX} + 1;
  EXPECT_THROW(cfg.validate(), kvchain::util::configuration_error);
}

KVCHAIN_TEST_F(config_test, shard_initialized_once) {
  EXPECT_EQ(config::shard().users, 4);
  EXPECT_THROW(config::initialize(), kvchain::util::configuration_error);
  co_return;
}

}  // namespace
