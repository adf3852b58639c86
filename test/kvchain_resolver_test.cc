#include "kvchain/resolver.hh"

#include "test/helper.hh"
#include "util/error.hh"

namespace {

using namespace kvchain;
using namespace kvchain::protocol;

using kvchain::test::l;

class resolver_test : public kvchain::test::action_test_base {};

KVCHAIN_TEST_F(resolver_test, no_client) {
  session s{1, "resolver_test"};
  EXPECT_THROW(parameter_resolver::resolve(s), kvchain::util::no_client_error);
  EXPECT_THROW(
      co_await parameter_resolver::resolve(s, "atomic", false, false),
      kvchain::util::no_client_error);
  try {
    co_await parameter_resolver::resolve(s, "atomic", false, false);
  } catch (const kvchain::util::resolution_error& ex) {
    EXPECT_STREQ(ex.what(), "no active client");
  }
  co_return;
}

KVCHAIN_TEST_F(resolver_test, async_conflicts) {
  auto s = co_await new_session();
  auto p = co_await parameter_resolver::resolve(s, "atomic", false, true);
  EXPECT_TRUE(p.cache);
  EXPECT_FALSE(p.tx);

  auto tx = co_await s.client()->tx_start({});
  auto in_tx = s.with_transaction(tx);
  EXPECT_THROW(
      co_await parameter_resolver::resolve(in_tx, "atomic", false, true),
      kvchain::util::async_conflict_error);
  p = co_await parameter_resolver::resolve(in_tx, "atomic", false, false);
  EXPECT_EQ(p.tx.get(), tx.get());

  auto locked = s.with_explicit_lock_used();
  EXPECT_THROW(
      co_await parameter_resolver::resolve(locked, "atomic", false, true),
      kvchain::util::async_conflict_error);
  p = co_await parameter_resolver::resolve(locked, "atomic", false, false);
  EXPECT_TRUE(p.cache);
  co_await tx->close();
  co_return;
}

KVCHAIN_TEST_F(resolver_test, cache_lookup) {
  auto s = co_await new_session();
  EXPECT_THROW(
      co_await parameter_resolver::resolve(s, "missing", false, false),
      kvchain::util::cache_not_found_error);
  auto p = co_await parameter_resolver::resolve(s, "atomic", true, false);
  EXPECT_EQ(p.cache->name(), "atomic");
  EXPECT_TRUE(p.cache->keep_binary());
  auto ip = parameter_resolver::resolve(s);
  EXPECT_EQ(ip.client.get(), s.client().get());
  EXPECT_FALSE(ip.tx);
  co_return;
}

}  // namespace
