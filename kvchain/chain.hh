#pragma once

#include <memory>
#include <vector>

#include "kvchain/action.hh"
#include "kvchain/transaction_action.hh"

namespace kvchain {

/// \class chain
///
/// \brief an ordered list of actions run by one session.
///
/// Action N+1 starts after action N has yielded its session. A failed action
/// stops the chain if config::exit_on_failure is set, otherwise the chain goes
/// on with the failed session and reports the first failure.
class chain {
 public:
  chain() = default;
  explicit chain(std::vector<action_ptr> actions);
  DEFAULT_MOVE_AND_ASSIGN(chain);

  chain& then(action_ptr a);
  size_t size() const noexcept { return _actions.size(); }
  bool empty() const noexcept { return _actions.empty(); }

  future<action_result> run(scenario_context& ctx, session s) const;

 private:
  std::vector<action_ptr> _actions;
};

// group_action attributes the statistics of its body to the group, the group is
// left whatever the outcome of the body
class group_action final : public action {
 public:
  group_action(std::string name, chain body);

 protected:
  future<action_result> do_execute(scenario_context& ctx, session s) override;

 private:
  chain _body;
};

// tx_scope_action begins a transaction, runs its body and always closes the
// transaction. A body failure takes precedence over a close failure.
class tx_scope_action final : public action {
 public:
  explicit tx_scope_action(
      chain body, std::optional<protocol::tx_options> opts = std::nullopt);

 protected:
  future<action_result> do_execute(scenario_context& ctx, session s) override;

 private:
  tx_begin_action _begin;
  chain _body;
  tx_close_action _close;
};

struct scenario {
  std::string name;
  chain actions;
};

}  // namespace kvchain
