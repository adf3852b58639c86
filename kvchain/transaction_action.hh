#pragma once

#include <optional>

#include "kvchain/action.hh"
#include "protocol/cache.hh"

namespace kvchain {

// tx_begin_action starts a transaction and stores it in the session. It fails
// if the session already holds one, which stays in the session.
class tx_begin_action final : public action {
 public:
  // the configured default options are used if opts is nullopt
  explicit tx_begin_action(
      std::optional<protocol::tx_options> opts = std::nullopt,
      std::string request_name = {});

 protected:
  future<action_result> do_execute(scenario_context& ctx, session s) override;

 private:
  std::optional<protocol::tx_options> _options;
};

class tx_commit_action final : public action {
 public:
  explicit tx_commit_action(std::string request_name = {});

 protected:
  future<action_result> do_execute(scenario_context& ctx, session s) override;
};

class tx_rollback_action final : public action {
 public:
  explicit tx_rollback_action(std::string request_name = {});

 protected:
  future<action_result> do_execute(scenario_context& ctx, session s) override;
};

// tx_close_action is a no-op without transaction, otherwise the transaction
// is removed from the session whether closing it succeeds or not
class tx_close_action final : public action {
 public:
  explicit tx_close_action(std::string request_name = {});

 protected:
  future<action_result> do_execute(scenario_context& ctx, session s) override;
};

}  // namespace kvchain
