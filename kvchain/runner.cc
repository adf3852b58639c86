#include "runner.hh"

#include <numeric>
#include <seastar/core/coroutine.hh>
#include <seastar/core/loop.hh>

#include "kvchain/cache_action.hh"
#include "kvchain/logger.hh"

namespace kvchain {

runner::runner(
    const config& cfg, stats_engine& stats, api::ignite_api_factory& factory)
  : _config(cfg), _stats(stats), _factory(factory) {}

future<std::vector<action_result>> runner::run(const scenario& sc) {
  l.info(
      "runner: scenario {} with {} users, concurrency:{}",
      sc.name,
      _config.users,
      _config.concurrency);
  api::ignite_api_ptr shared;
  if (_config.shared_client) {
    shared = co_await _factory.make();
  }
  scenario_context ctx{.cfg = _config, .stats = _stats, .factory = &_factory};
  std::vector<std::optional<action_result>> outcomes(_config.users);
  std::vector<uint64_t> users(_config.users);
  std::iota(users.begin(), users.end(), 1);
  co_await max_concurrent_for_each(
      users, _config.concurrency, [&](uint64_t user) {
        return run_session(ctx, sc, user, shared)
            .then([&outcomes, user](action_result r) {
              outcomes[user - 1] = std::move(r);
            });
      });
  if (shared) {
    co_await shared->close();
  }
  std::vector<action_result> results;
  results.reserve(outcomes.size());
  for (auto& r : outcomes) {
    results.emplace_back(std::move(*r));
  }
  co_return results;
}

future<action_result> runner::run_session(
    scenario_context& ctx,
    const scenario& sc,
    uint64_t user,
    api::ignite_api_ptr shared) {
  session s{user, sc.name};
  if (shared) {
    s = s.with_client(shared);
  }
  auto r = co_await sc.actions.run(ctx, std::move(s));
  if (!r.ok()) {
    l.debug("runner: user:{} failed, {}", user, *r.failure);
  }
  co_await release(r.s, shared);
  co_return r;
}

future<> runner::release(const session& s, const api::ignite_api_ptr& shared) {
  if (auto tx = s.transaction(); tx) {
    l.warn("runner: user:{} left tx:{} open, closing", s.user_id(), tx->id());
    try {
      co_await tx->close();
    } catch (const std::exception& ex) {
      l.warn(
          "runner: user:{} failed to close tx:{}, {}",
          s.user_id(),
          tx->id(),
          ex.what());
    }
  }
  auto client = s.client();
  if (!client) {
    co_return;
  }
  if (!s.locks().empty()) {
    l.warn(
        "runner: user:{} left {} locks held, unlocking",
        s.user_id(),
        s.locks().size());
    co_await release_locks(client, s.locks());
  }
  if (client != shared) {
    l.warn("runner: user:{} left its client open, closing", s.user_id());
    try {
      co_await client->close();
    } catch (const std::exception& ex) {
      l.warn(
          "runner: user:{} failed to close its client, {}",
          s.user_id(),
          ex.what());
    }
  }
}

}  // namespace kvchain
