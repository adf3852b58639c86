#include "helper.hh"

#include <seastar/core/coroutine.hh>

#include "util/error.hh"

namespace kvchain::test {

future<> faulty_transaction::commit() {
  if (_faults.fail_commit) {
    throw util::transaction_error(id(), "injected commit failure");
  }
  co_await _tx->commit();
}

future<> faulty_transaction::rollback() {
  if (_faults.fail_rollback) {
    throw util::transaction_error(id(), "injected rollback failure");
  }
  co_await _tx->rollback();
}

future<> faulty_transaction::close() {
  _faults.tx_closed++;
  co_await _tx->close();
  if (_faults.fail_tx_close) {
    throw util::transaction_error(id(), "injected close failure");
  }
}

future<api::transaction_api_ptr> faulty_ignite_api::tx_start(
    protocol::tx_options opts) {
  if (_faults.fail_tx_start) {
    throw util::operation_error("injected tx_start failure");
  }
  auto tx = co_await _client->tx_start(opts);
  _faults.tx_started++;
  co_return make_shared<faulty_transaction>(std::move(tx), _faults);
}

future<> faulty_ignite_api::close() {
  _faults.client_closed++;
  co_await _client->close();
  if (_faults.fail_client_close) {
    throw util::closed_error("injected close failure");
  }
}

future<api::ignite_api_ptr> faulty_factory::make() {
  auto client = co_await _factory.make();
  co_return make_shared<faulty_ignite_api>(std::move(client), _faults);
}

config helper::default_config() {
  return config{
      .check = check_policy::aggregate,
      .exit_on_failure = true,
      .shared_client = true,
      .users = 4,
      .concurrency = 2,
  };
}

protocol::cache_config helper::atomic(std::string name) {
  return protocol::cache_config{
      .name = std::move(name),
      .atomicity = protocol::cache_atomicity::atomic,
  };
}

protocol::cache_config helper::transactional(std::string name) {
  return protocol::cache_config{
      .name = std::move(name),
      .atomicity = protocol::cache_atomicity::transactional,
  };
}

void action_test_base::SetUp() {
  base::submit([this]() -> future<> {
    _cluster = std::make_unique<api::memory_cluster>();
    _cluster->get_or_create(helper::atomic("atomic"));
    _cluster->get_or_create(helper::transactional("transactional"));
    _factory = std::make_unique<api::memory_ignite_api_factory>(*_cluster);
    _faulty_factory = std::make_unique<faulty_factory>(*_cluster, _faults);
    _ctx = std::make_unique<scenario_context>(scenario_context{
        .cfg = _config, .stats = _stats, .factory = _factory.get()});
    co_return;
  });
}

void action_test_base::TearDown() {
  base::submit([this]() -> future<> {
    _ctx.reset();
    _faulty_factory.reset();
    _factory.reset();
    _cluster.reset();
    co_return;
  });
}

future<session> action_test_base::new_session() {
  auto client = co_await _factory->make();
  co_return session{1, "test"}.with_client(std::move(client));
}

future<session> action_test_base::new_faulty_session() {
  auto client = co_await _faulty_factory->make();
  co_return session{1, "test"}.with_client(std::move(client));
}

}  // namespace kvchain::test
