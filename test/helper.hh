#pragma once

#include <memory>

#include "api/ignite_api.hh"
#include "api/memory.hh"
#include "kvchain/action.hh"
#include "kvchain/config.hh"
#include "kvchain/stats.hh"
#include "test/base.hh"

namespace kvchain::test {

// faults injected into the wrapped handles, shared by every handle made from
// the same faulty_factory
struct faults {
  bool fail_tx_start = false;
  bool fail_commit = false;
  bool fail_rollback = false;
  bool fail_tx_close = false;
  bool fail_client_close = false;

  size_t tx_started = 0;
  size_t tx_closed = 0;
  size_t client_closed = 0;
};

class faulty_transaction final : public api::transaction_api {
 public:
  faulty_transaction(api::transaction_api_ptr tx, faults& f)
    : _tx(std::move(tx)), _faults(f) {}

  uint64_t id() const override { return _tx->id(); }
  protocol::tx_state state() const override { return _tx->state(); }
  future<> commit() override;
  future<> rollback() override;
  future<> close() override;

 private:
  api::transaction_api_ptr _tx;
  faults& _faults;
};

// only atomic caches can be used with a faulty_transaction, transactional
// caches of the memory cluster reject foreign transactions
class faulty_ignite_api final : public api::ignite_api {
 public:
  faulty_ignite_api(api::ignite_api_ptr client, faults& f)
    : _client(std::move(client)), _faults(f) {}

  future<api::cache_api_ptr> cache(std::string_view name) override {
    return _client->cache(name);
  }
  future<api::cache_api_ptr> get_or_create_cache(
      protocol::cache_config cfg) override {
    return _client->get_or_create_cache(std::move(cfg));
  }
  future<api::transaction_api_ptr> tx_start(protocol::tx_options opts) override;
  future<> close() override;

 private:
  api::ignite_api_ptr _client;
  faults& _faults;
};

class faulty_factory final : public api::ignite_api_factory {
 public:
  faulty_factory(api::memory_cluster& cluster, faults& f)
    : _factory(cluster), _faults(f) {}

  future<api::ignite_api_ptr> make() override;

 private:
  api::memory_ignite_api_factory _factory;
  faults& _faults;
};

class helper {
 public:
  static config default_config();
  static protocol::cache_config atomic(std::string name);
  static protocol::cache_config transactional(std::string name);
};

// action_test_base owns an in-memory cluster with an "atomic" cache and a
// "transactional" cache, and a scenario context recording into stats
class action_test_base : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  // a session of user 1 with a fresh client of the cluster
  future<session> new_session();
  // a session of user 1 with a client injecting _faults
  future<session> new_faulty_session();

  config _config = helper::default_config();
  faults _faults;
  stats_recorder _stats;
  std::unique_ptr<api::memory_cluster> _cluster;
  std::unique_ptr<api::memory_ignite_api_factory> _factory;
  std::unique_ptr<faulty_factory> _faulty_factory;
  std::unique_ptr<scenario_context> _ctx;
};

}  // namespace kvchain::test
