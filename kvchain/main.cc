#include <algorithm>
#include <fstream>
#include <seastar/core/app-template.hh>
#include <seastar/core/coroutine.hh>

#include "api/memory.hh"
#include "kvchain/config.hh"
#include "kvchain/dsl.hh"
#include "kvchain/logger.hh"
#include "kvchain/runner.hh"
#include "kvchain/stats.hh"
#include "util/error.hh"

using namespace seastar;

namespace {

using kvchain::entries;
using kvchain::protocol::cache_atomicity;
using kvchain::protocol::cache_config;
using kvchain::protocol::value;
namespace dsl = kvchain::dsl;

value key_of(const kvchain::session& s) {
  return value(s.user_id());
}

value value_of(const kvchain::session& s) {
  return value(fmt::format("value-{}", s.user_id()));
}

// async operations outside of transactions on an atomic cache, synchronous
// ones inside a transaction on a transactional cache
kvchain::scenario put_get_scenario() {
  return dsl::scenario(
      "put-get",
      dsl::group(
          "setup",
          dsl::sequence(
              dsl::create_cache(cache_config{
                  .name = "atomic", .atomicity = cache_atomicity::atomic}),
              dsl::create_cache(cache_config{
                  .name = "transactional",
                  .atomicity = cache_atomicity::transactional}))),
      dsl::put("atomic", {key_of, value_of}, {.async = true}),
      dsl::get(
          "atomic",
          key_of,
          {.checks = {entries().find().is({key_of, value_of})}, .async = true}),
      dsl::tx(
          dsl::put("transactional", {key_of, value_of}),
          dsl::get(
              "transactional",
              key_of,
              {.checks = {entries().find_key(key_of).transform(
                                            [](const auto& e) { return e.val; })
                              .is(value_of)}}),
          dsl::commit()),
      dsl::get_and_remove(
          "transactional",
          key_of,
          {.checks = {entries().count().is(1)}}),
      dsl::get(
          "transactional", key_of, {.checks = {entries().not_exists()}}));
}

}  // namespace

static int kvchain_main(int argc, char** argv) {
  namespace bpo = boost::program_options;
  app_template::config app_cfg;
  app_cfg.name = "kvchain";
  app_cfg.description = "kvchain put/get demo on an in-memory cluster";
  app_template app{std::move(app_cfg)};
  app.add_options()(
      "config_file",
      bpo::value<sstring>()->default_value(""),
      "kvchain config file path");
  app.add_options()(
      "users", bpo::value<uint64_t>(), "number of sessions, overrides config");

  return app.run(argc, argv, [&]() -> future<int> {
    kvchain::l.info("kvchain initializing...");
    auto&& opts = app.configuration();
    kvchain::config config;
    auto&& config_file = opts["config_file"].as<sstring>();
    if (!config_file.empty()) {
      std::ifstream ifs{config_file, std::ios::in};
      if (!ifs.good()) {
        kvchain::l.error("bad config_file:{}", config_file);
        co_return 255;
      }
      try {
        config = kvchain::config::read_from(ifs);
      } catch (const kvchain::util::configuration_error& ex) {
        kvchain::l.error("bad config_file:{}, {}", config_file, ex.what());
        co_return 255;
      }
    }
    if (opts.count("users")) {
      config.users = opts["users"].as<uint64_t>();
    }
    try {
      kvchain::config::initialize(config);
    } catch (const kvchain::util::configuration_error& ex) {
      kvchain::l.error("invalid config:{}", ex.what());
      co_return 255;
    }
    co_await kvchain::config::broadcast();
    kvchain::l.info("config: {}", kvchain::config::shard());

    kvchain::api::memory_cluster cluster;
    kvchain::api::memory_ignite_api_factory factory{cluster};
    kvchain::stats_recorder stats;
    kvchain::runner runner{kvchain::config::shard(), stats, factory};
    auto sc = put_get_scenario();
    auto results = co_await runner.run(sc);
    auto failed = std::count_if(results.begin(), results.end(), [](auto& r) {
      return !r.ok();
    });
    kvchain::l.info(
        "scenario {} done, {} of {} sessions failed\n{}",
        sc.name,
        failed,
        results.size(),
        stats);
    co_return stats.failed_requests() == 0 ? 0 : 1;
  });
}

int main(int argc, char** argv) { return kvchain_main(argc, argv); }
