#pragma once

#include <concepts>
#include <optional>
#include <string>
#include <utility>

#include "kvchain/cache_action.hh"
#include "kvchain/chain.hh"
#include "kvchain/check.hh"
#include "kvchain/client_action.hh"
#include "kvchain/expression.hh"
#include "kvchain/transaction_action.hh"

// The builders used to declare scenarios, e.g.
//
//   auto s = dsl::scenario(
//       "put-get",
//       dsl::put("C", {"#{key}", "#{value}"}),
//       dsl::get("C", "#{key}", {.checks = {entries().find().is(...)}}));
namespace kvchain::dsl {

action_ptr get(std::string cache, value_expr key, cache_options opts = {});
action_ptr get_all(std::string cache, keys_expr keys, cache_options opts = {});
action_ptr put(std::string cache, entry_expr e, cache_options opts = {});
action_ptr put_all(
    std::string cache, entries_expr entries, cache_options opts = {});
action_ptr remove(std::string cache, value_expr key, cache_options opts = {});
action_ptr remove_all(
    std::string cache, keys_expr keys, cache_options opts = {});
action_ptr get_and_put(
    std::string cache, entry_expr e, cache_options opts = {});
action_ptr get_and_remove(
    std::string cache, value_expr key, cache_options opts = {});
action_ptr lock(std::string cache, value_expr key, cache_options opts = {});
action_ptr unlock(std::string cache, value_expr key, cache_options opts = {});

action_ptr tx_start(
    std::optional<protocol::tx_options> opts = std::nullopt,
    std::string name = {});
action_ptr commit(std::string name = {});
action_ptr rollback(std::string name = {});
action_ptr tx_close(std::string name = {});

action_ptr start_client(std::string name = {});
action_ptr close_client(std::string name = {});
action_ptr create_cache(protocol::cache_config cfg, std::string name = {});

template <typename... Actions>
  requires(std::convertible_to<Actions, action_ptr> && ...)
chain sequence(Actions&&... actions) {
  chain c;
  (c.then(std::forward<Actions>(actions)), ...);
  return c;
}

// tx runs the body in a transaction which is always closed afterwards
action_ptr tx(chain body, std::optional<protocol::tx_options> opts = {});

template <typename... Actions>
  requires(std::convertible_to<Actions, action_ptr> && ...)
action_ptr tx(Actions&&... actions) {
  return tx(sequence(std::forward<Actions>(actions)...));
}

action_ptr group(std::string name, chain body);

template <typename... Actions>
  requires(std::convertible_to<Actions, action_ptr> && ...)
kvchain::scenario scenario(std::string name, Actions&&... actions) {
  return kvchain::scenario{
      .name = std::move(name),
      .actions = sequence(std::forward<Actions>(actions)...)};
}

}  // namespace kvchain::dsl
