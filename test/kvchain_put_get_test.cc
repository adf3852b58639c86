#include "kvchain/dsl.hh"
#include "kvchain/runner.hh"
#include "test/helper.hh"

namespace {

using namespace kvchain;
using namespace kvchain::protocol;

using kvchain::test::helper;
using kvchain::test::l;

value key_of(const session& s) { return value(s.user_id()); }

value value_of(const session& s) {
  return value(fmt::format("value-{}", s.user_id()));
}

class put_get_test : public kvchain::test::action_test_base {
 protected:
  static kvchain::scenario make_scenario() {
    return dsl::scenario(
        "put-get",
        dsl::group(
            "setup",
            dsl::sequence(
                dsl::create_cache(helper::atomic("pg-atomic")),
                dsl::create_cache(helper::transactional("pg-tx")))),
        dsl::put("pg-atomic", {key_of, value_of}, {.async = true}),
        dsl::get(
            "pg-atomic",
            key_of,
            {.checks = {entries().find().is({key_of, value_of})},
             .async = true}),
        dsl::tx(
            dsl::put("pg-tx", {key_of, value_of}),
            dsl::get(
                "pg-tx",
                key_of,
                {.checks = {entries()
                                .find_key(key_of)
                                .transform([](const entry& e) { return e.val; })
                                .save_as("saved")}}),
            dsl::commit()),
        dsl::get_and_remove(
            "pg-tx", key_of, {.checks = {entries().count().is(1)}}),
        dsl::get("pg-tx", key_of, {.checks = {entries().not_exists()}}),
        dsl::put("pg-atomic", {"copy-#{saved}", "#{saved}"}));
  }
};

KVCHAIN_TEST_F(put_get_test, scenario) {
  _config.users = 6;
  _config.concurrency = 3;
  runner r{_config, _stats, *_factory};
  auto sc = make_scenario();
  auto results = co_await r.run(sc);
  ASSERT_EQ(results.size(), 6);
  for (const auto& result : results) {
    ASSERT_TRUE(result.ok()) << *result.failure;
    EXPECT_FALSE(result.s.failed());
    EXPECT_FALSE(result.s.transaction());
    auto expected = value_of(result.s);
    EXPECT_EQ(result.s.value("saved"), expected);
  }
  EXPECT_EQ(_stats.failed_requests(), 0);
  EXPECT_EQ(_stats.count("getOrCreateCache pg-tx", request_status::ok), 6);
  EXPECT_EQ(_stats.count("commit", request_status::ok), 6);
  EXPECT_EQ(_stats.count("txClose", request_status::ok), 6);

  auto* atomic = _cluster->find("pg-atomic");
  ASSERT_NE(atomic, nullptr);
  // one entry per user and one copy of every saved value
  EXPECT_EQ(atomic->data.size(), 12);
  EXPECT_EQ(atomic->data.at(value("copy-value-3")), value("value-3"));
  auto* tx = _cluster->find("pg-tx");
  ASSERT_NE(tx, nullptr);
  EXPECT_TRUE(tx->data.empty());
  co_return;
}

KVCHAIN_TEST_F(put_get_test, failed_sessions_are_reported) {
  _config.users = 2;
  runner r{_config, _stats, *_factory};
  // every user reads the entry of user 1
  auto sc = dsl::scenario(
      "mismatch",
      dsl::put("atomic", {key_of, value_of}),
      dsl::get(
          "atomic",
          1,
          {.checks = {entries().find().transform([](const entry& e) {
                         return e.val;
                       }).is(value_of)}}),
      dsl::remove("atomic", key_of));
  auto results = co_await r.run(sc);
  ASSERT_EQ(results.size(), 2);
  EXPECT_FALSE(results.back().ok());
  EXPECT_TRUE(results.back().s.failed());
  EXPECT_EQ(_stats.count("get atomic", request_status::ko), 1);
  // the chain stops before the removal
  EXPECT_EQ(_stats.count("remove atomic", request_status::ok), 1);
  EXPECT_TRUE(_cluster->find("atomic")->data.contains(value(2)));
  co_return;
}

}  // namespace
