#pragma once

#include <optional>
#include <seastar/core/future.hh>
#include <seastar/util/noncopyable_function.hh>
#include <string>
#include <vector>

#include "api/ignite_api.hh"
#include "kvchain/check.hh"
#include "kvchain/config.hh"
#include "kvchain/session.hh"
#include "kvchain/stats.hh"
#include "util/seastarx.hh"
#include "util/types.hh"

namespace kvchain {

struct action_result {
  // the outgoing session
  session s;
  // nullopt means continue, the failure reason otherwise
  std::optional<std::string> failure;

  bool ok() const noexcept { return !failure.has_value(); }

  static action_result proceed(session s);
  static action_result fail(session s, std::string reason);
};

struct scenario_context {
  const config& cfg;
  stats_engine& stats;
  // used by the start client action, may be null if sessions are seeded
  api::ignite_api_factory* factory = nullptr;
};

/// \class action
///
/// \brief one step of a session chain.
///
/// An action resolves its parameters from the session, invokes one capability
/// operation, runs its checks and yields the outgoing session. The future
/// returned by execute never resolves exceptionally: a failure to resolve the
/// parameters is recorded as a crash and leaves the session untouched, a
/// failed operation or check is recorded as a KO response.
class action {
 public:
  action(std::string type, std::string resource, std::string request_name);
  virtual ~action() = default;
  DISALLOW_COPY_MOVE_AND_ASSIGN(action);

  const std::string& type() const noexcept { return _type; }
  const std::string& resource() const noexcept { return _resource; }
  const std::string& request_name() const noexcept { return _request_name; }

  future<action_result> execute(scenario_context& ctx, session s);

 protected:
  using session_op = noncopyable_function<future<session>()>;
  using cache_op = noncopyable_function<future<protocol::entry_map>()>;

  // throws to report a resolution failure
  virtual future<action_result> do_execute(
      scenario_context& ctx, session s) = 0;

  // report times the op and logs the response. On failure the outgoing session
  // is the on_failure one if given, the incoming one otherwise, marked failed.
  future<action_result> report(
      scenario_context& ctx,
      session s,
      session_op op,
      std::optional<session> on_failure = std::nullopt);

  // report a cache operation whose result goes through the checks
  future<action_result> report(
      scenario_context& ctx,
      session s,
      const std::vector<check>& checks,
      cache_op op);

  // reject fails without attempting any operation
  action_result reject(scenario_context& ctx, session s, std::string reason);
  // acknowledge proceeds without any operation, logged as an OK response
  action_result acknowledge(scenario_context& ctx, session s);

  std::string failure_message(std::string_view reason) const;

 private:
  std::string _type;
  std::string _resource;
  std::string _request_name;
};

using action_ptr = std::unique_ptr<action>;

}  // namespace kvchain
