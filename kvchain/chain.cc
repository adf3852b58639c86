#include "chain.hh"

#include <seastar/core/coroutine.hh>

#include "kvchain/logger.hh"

namespace kvchain {

chain::chain(std::vector<action_ptr> actions) : _actions(std::move(actions)) {}

chain& chain::then(action_ptr a) {
  _actions.emplace_back(std::move(a));
  return *this;
}

future<action_result> chain::run(scenario_context& ctx, session s) const {
  std::optional<std::string> first_failure;
  for (const auto& a : _actions) {
    auto r = co_await a->execute(ctx, std::move(s));
    s = std::move(r.s);
    if (r.ok()) {
      continue;
    }
    if (ctx.cfg.exit_on_failure) {
      l.debug("chain: exit at {}, {}", a->request_name(), *r.failure);
      co_return action_result{.s = std::move(s), .failure = r.failure};
    }
    if (!first_failure.has_value()) {
      first_failure = std::move(r.failure);
    }
  }
  co_return action_result{.s = std::move(s), .failure = first_failure};
}

group_action::group_action(std::string name, chain body)
  : action("group", std::move(name), ""), _body(std::move(body)) {}

future<action_result> group_action::do_execute(
    scenario_context& ctx, session s) {
  auto r = co_await _body.run(ctx, s.enter_group(resource()));
  r.s = r.s.exit_group();
  co_return r;
}

tx_scope_action::tx_scope_action(
    chain body, std::optional<protocol::tx_options> opts)
  : action("tx", "", ""), _begin(opts), _body(std::move(body)) {}

future<action_result> tx_scope_action::do_execute(
    scenario_context& ctx, session s) {
  auto begun = co_await _begin.execute(ctx, std::move(s));
  if (!begun.ok()) {
    co_return begun;
  }
  auto body = co_await _body.run(ctx, std::move(begun.s));
  auto closed = co_await _close.execute(ctx, std::move(body.s));
  if (!body.ok()) {
    closed.failure = std::move(body.failure);
  }
  co_return closed;
}

}  // namespace kvchain
