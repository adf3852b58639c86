#pragma once

#include "kvchain/action.hh"
#include "protocol/cache.hh"

namespace kvchain {

// start_client_action makes a client with the scenario's factory
class start_client_action final : public action {
 public:
  explicit start_client_action(std::string request_name = {});

 protected:
  future<action_result> do_execute(scenario_context& ctx, session s) override;
};

// close_client_action is a no-op without client, otherwise the client is
// removed from the session whether closing it succeeds or not
class close_client_action final : public action {
 public:
  explicit close_client_action(std::string request_name = {});

 protected:
  future<action_result> do_execute(scenario_context& ctx, session s) override;
};

class create_cache_action final : public action {
 public:
  explicit create_cache_action(
      protocol::cache_config cfg, std::string request_name = {});

 protected:
  future<action_result> do_execute(scenario_context& ctx, session s) override;

 private:
  protocol::cache_config _config;
};

}  // namespace kvchain
