#include "transaction_action.hh"

#include <seastar/core/coroutine.hh>

#include "kvchain/logger.hh"
#include "kvchain/resolver.hh"

namespace kvchain {

tx_begin_action::tx_begin_action(
    std::optional<protocol::tx_options> opts, std::string request_name)
  : action("txStart", "", std::move(request_name)), _options(opts) {}

future<action_result> tx_begin_action::do_execute(
    scenario_context& ctx, session s) {
  auto p = parameter_resolver::resolve(s);
  if (p.tx) {
    co_return reject(ctx, std::move(s), "transaction already started");
  }
  auto opts = _options.value_or(ctx.cfg.default_tx_options());
  auto next = s;
  co_return co_await report(
      ctx,
      std::move(s),
      [client = std::move(p.client), opts, next = std::move(next)]() {
        return client->tx_start(opts).then(
            [next](api::transaction_api_ptr tx) {
              l.trace("txStart: tx:{} started", tx->id());
              return next.with_transaction(std::move(tx));
            });
      });
}

tx_commit_action::tx_commit_action(std::string request_name)
  : action("commit", "", std::move(request_name)) {}

future<action_result> tx_commit_action::do_execute(
    scenario_context& ctx, session s) {
  auto p = parameter_resolver::resolve(s);
  if (!p.tx) {
    co_return reject(ctx, std::move(s), "no active transaction");
  }
  auto next = s;
  co_return co_await report(
      ctx,
      std::move(s),
      [tx = std::move(p.tx), next = std::move(next)]() {
        return tx->commit().then([next] { return next; });
      });
}

tx_rollback_action::tx_rollback_action(std::string request_name)
  : action("rollback", "", std::move(request_name)) {}

future<action_result> tx_rollback_action::do_execute(
    scenario_context& ctx, session s) {
  auto p = parameter_resolver::resolve(s);
  if (!p.tx) {
    co_return reject(ctx, std::move(s), "no active transaction");
  }
  auto next = s;
  co_return co_await report(
      ctx,
      std::move(s),
      [tx = std::move(p.tx), next = std::move(next)]() {
        return tx->rollback().then([next] { return next; });
      });
}

tx_close_action::tx_close_action(std::string request_name)
  : action("txClose", "", std::move(request_name)) {}

future<action_result> tx_close_action::do_execute(
    scenario_context& ctx, session s) {
  auto tx = s.transaction();
  if (!tx) {
    co_return acknowledge(ctx, std::move(s));
  }
  auto released = s.without_transaction();
  co_return co_await report(
      ctx,
      std::move(s),
      [tx = std::move(tx), released]() {
        return tx->close().then([released] { return released; });
      },
      released);
}

}  // namespace kvchain
