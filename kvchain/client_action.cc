#include "client_action.hh"

#include <seastar/core/coroutine.hh>

#include "kvchain/cache_action.hh"
#include "kvchain/resolver.hh"
#include "util/error.hh"

namespace kvchain {

start_client_action::start_client_action(std::string request_name)
  : action("start", "", std::move(request_name)) {}

future<action_result> start_client_action::do_execute(
    scenario_context& ctx, session s) {
  if (ctx.factory == nullptr) {
    throw util::invalid_argument("factory", "no client factory in scenario");
  }
  if (s.client()) {
    co_return reject(ctx, std::move(s), "client already started");
  }
  auto next = s;
  co_return co_await report(
      ctx,
      std::move(s),
      [factory = ctx.factory, next = std::move(next)]() {
        return factory->make().then([next](api::ignite_api_ptr client) {
          return next.with_client(std::move(client));
        });
      });
}

close_client_action::close_client_action(std::string request_name)
  : action("close", "", std::move(request_name)) {}

future<action_result> close_client_action::do_execute(
    scenario_context& ctx, session s) {
  auto client = s.client();
  if (!client) {
    co_return acknowledge(ctx, std::move(s));
  }
  auto released = s.without_client().without_locks();
  auto locks = s.locks();
  co_return co_await report(
      ctx,
      std::move(s),
      [client = std::move(client), locks = std::move(locks), released]() {
        return release_locks(client, locks).then([client, released] {
          return client->close().then([released] { return released; });
        });
      },
      released);
}

create_cache_action::create_cache_action(
    protocol::cache_config cfg, std::string request_name)
  : action("getOrCreateCache", cfg.name, std::move(request_name))
  , _config(std::move(cfg)) {}

future<action_result> create_cache_action::do_execute(
    scenario_context& ctx, session s) {
  auto p = parameter_resolver::resolve(s);
  auto next = s;
  co_return co_await report(
      ctx,
      std::move(s),
      [client = std::move(p.client), cfg = _config, next = std::move(next)]() {
        return client->get_or_create_cache(cfg).then(
            [next](api::cache_api_ptr) { return next; });
      });
}

}  // namespace kvchain
