#include "api/memory.hh"

#include <seastar/core/sleep.hh>

#include "protocol/serializer.hh"
#include "test/helper.hh"
#include "util/error.hh"

namespace {

using namespace kvchain;
using namespace kvchain::protocol;
using namespace std::chrono_literals;

using helper = kvchain::test::helper;
using kvchain::test::base;
using kvchain::test::l;

class memory_api_test : public ::testing::Test {
 protected:
  void SetUp() override {
    base::submit([this]() -> future<> {
      _cluster = std::make_unique<kvchain::api::memory_cluster>();
      _factory =
          std::make_unique<kvchain::api::memory_ignite_api_factory>(*_cluster);
      _client = co_await _factory->make();
      _atomic = co_await _client->get_or_create_cache(helper::atomic("atomic"));
      _transactional = co_await _client->get_or_create_cache(
          helper::transactional("transactional"));
    });
  }

  void TearDown() override {
    base::submit([this]() -> future<> {
      co_await _client->close();
      _atomic = nullptr;
      _transactional = nullptr;
      _client = nullptr;
      _factory.reset();
      _cluster.reset();
    });
  }

  std::unique_ptr<kvchain::api::memory_cluster> _cluster;
  std::unique_ptr<kvchain::api::memory_ignite_api_factory> _factory;
  kvchain::api::ignite_api_ptr _client;
  kvchain::api::cache_api_ptr _atomic;
  kvchain::api::cache_api_ptr _transactional;
};

KVCHAIN_TEST_F(memory_api_test, put_get_remove) {
  co_await _atomic->put(1, "a", nullptr);
  auto r = co_await _atomic->get(1, nullptr);
  EXPECT_EQ(r, (entry_map{{value{1}, value{"a"}}}));
  co_await _atomic->put_all({{2, "b"}, {3, "c"}}, nullptr);
  r = co_await _atomic->get_all({1, 2, 4}, nullptr);
  EXPECT_EQ(r.size(), 2);
  co_await _atomic->remove(1, nullptr);
  r = co_await _atomic->get(1, nullptr);
  EXPECT_TRUE(r.empty());
  co_await _atomic->remove_all({2, 3}, nullptr);
  r = co_await _atomic->get_all({2, 3}, nullptr);
  EXPECT_TRUE(r.empty());
  EXPECT_THROW(
      co_await _atomic->put(1, value{}, nullptr),
      kvchain::util::invalid_argument);
  co_return;
}

KVCHAIN_TEST_F(memory_api_test, get_and_put_get_and_remove) {
  auto previous = co_await _atomic->get_and_put(1, "a", nullptr);
  EXPECT_TRUE(previous.empty());
  previous = co_await _atomic->get_and_put(1, "b", nullptr);
  EXPECT_EQ(previous, (entry_map{{value{1}, value{"a"}}}));
  auto removed = co_await _atomic->get_and_remove(1, nullptr);
  EXPECT_EQ(removed, (entry_map{{value{1}, value{"b"}}}));
  removed = co_await _atomic->get_and_remove(1, nullptr);
  EXPECT_TRUE(removed.empty());
  EXPECT_TRUE((co_await _atomic->get(1, nullptr)).empty());
  co_return;
}

KVCHAIN_TEST_F(memory_api_test, async_variants) {
  co_await _atomic->put_async(1, "a");
  auto r = co_await _atomic->get_async(1);
  EXPECT_EQ(r.size(), 1);
  auto previous = co_await _atomic->get_and_put_async(1, "b");
  EXPECT_EQ(previous.at(value{1}), value{"a"});
  co_await _atomic->put_all_async({{2, "c"}});
  EXPECT_EQ((co_await _atomic->get_all_async({1, 2})).size(), 2);
  auto removed = co_await _atomic->get_and_remove_async(1);
  EXPECT_EQ(removed.at(value{1}), value{"b"});
  co_await _atomic->remove_async(2);
  co_await _atomic->remove_all_async({1, 2});
  EXPECT_TRUE((co_await _atomic->get_all_async({1, 2})).empty());
  co_return;
}

KVCHAIN_TEST_F(memory_api_test, transaction_isolation) {
  auto tx = co_await _client->tx_start({});
  EXPECT_EQ(tx->state(), tx_state::active);
  co_await _transactional->put(1, "a", tx.get());
  // read your writes
  EXPECT_EQ((co_await _transactional->get(1, tx.get())).size(), 1);
  // invisible outside of the transaction before commit
  EXPECT_TRUE((co_await _transactional->get(1, nullptr)).empty());
  co_await tx->commit();
  EXPECT_EQ(tx->state(), tx_state::committed);
  EXPECT_EQ((co_await _transactional->get(1, nullptr)).size(), 1);
  EXPECT_THROW(co_await tx->commit(), kvchain::util::transaction_error);
  EXPECT_THROW(co_await tx->rollback(), kvchain::util::transaction_error);
  co_await tx->close();
  co_await tx->close();
  EXPECT_EQ(tx->state(), tx_state::committed);
  EXPECT_THROW(
      co_await _transactional->get(1, tx.get()),
      kvchain::util::transaction_error);
  co_return;
}

KVCHAIN_TEST_F(memory_api_test, close_without_commit_discards) {
  auto tx = co_await _client->tx_start({});
  co_await _transactional->put(1, "a", tx.get());
  co_await _transactional->remove(2, tx.get());
  co_await tx->close();
  EXPECT_EQ(tx->state(), tx_state::closed);
  EXPECT_TRUE((co_await _transactional->get(1, nullptr)).empty());

  tx = co_await _client->tx_start({});
  co_await _transactional->put(1, "a", tx.get());
  co_await tx->rollback();
  EXPECT_EQ(tx->state(), tx_state::rolled_back);
  co_await tx->close();
  EXPECT_TRUE((co_await _transactional->get(1, nullptr)).empty());
  co_return;
}

KVCHAIN_TEST_F(memory_api_test, transaction_timeout) {
  auto tx = co_await _client->tx_start({.timeout = 1ms});
  co_await _transactional->put(1, "a", tx.get());
  co_await seastar::sleep(5ms);
  EXPECT_THROW(co_await tx->commit(), kvchain::util::transaction_error);
  EXPECT_EQ(tx->state(), tx_state::rolled_back);
  co_await tx->close();
  EXPECT_TRUE((co_await _transactional->get(1, nullptr)).empty());
  co_return;
}

KVCHAIN_TEST_F(memory_api_test, atomic_cache_ignores_transaction) {
  auto tx = co_await _client->tx_start({});
  co_await _atomic->put(1, "a", tx.get());
  co_await tx->close();
  EXPECT_EQ((co_await _atomic->get(1, nullptr)).size(), 1);
  co_return;
}

KVCHAIN_TEST_F(memory_api_test, keep_binary) {
  auto binary = _atomic->with_keep_binary();
  EXPECT_TRUE(binary->keep_binary());
  EXPECT_FALSE(_atomic->keep_binary());
  co_await _atomic->put(1, 42, nullptr);
  auto r = co_await binary->get(1, nullptr);
  ASSERT_EQ(r.size(), 1);
  EXPECT_EQ(r.at(value{1}), value{to_binary(value{42})});
  co_await binary->put(2, value{to_binary(value{"x"})}, nullptr);
  EXPECT_EQ((co_await _atomic->get(2, nullptr)).at(value{2}), value{"x"});
  co_return;
}

KVCHAIN_TEST_F(memory_api_test, explicit_lock) {
  co_await _atomic->lock(1);
  // reentrant for the same client
  co_await _atomic->lock(1);
  auto other = co_await _factory->make();
  auto other_cache = co_await other->cache("atomic");
  bool acquired = false;
  auto waiter = other_cache->lock(1).then([&acquired] { acquired = true; });
  co_await seastar::sleep(1ms);
  EXPECT_FALSE(acquired);
  co_await _atomic->unlock(1);
  co_await seastar::sleep(1ms);
  EXPECT_FALSE(acquired);
  co_await _atomic->unlock(1);
  co_await std::move(waiter);
  EXPECT_TRUE(acquired);
  EXPECT_THROW(co_await _atomic->unlock(1), kvchain::util::operation_error);
  co_await other_cache->unlock(1);
  co_await other->close();
  co_return;
}

KVCHAIN_TEST_F(memory_api_test, client_errors) {
  EXPECT_THROW(
      co_await _client->cache("missing"),
      kvchain::util::cache_not_found_error);
  auto other = co_await _factory->make();
  co_await other->close();
  EXPECT_THROW(co_await other->cache("atomic"), kvchain::util::closed_error);
  EXPECT_THROW(co_await other->tx_start({}), kvchain::util::closed_error);
  EXPECT_EQ(_cluster->cache_count(), 2);
  co_return;
}

}  // namespace
