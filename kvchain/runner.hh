#pragma once

#include <vector>

#include "api/ignite_api.hh"
#include "kvchain/chain.hh"
#include "kvchain/config.hh"
#include "kvchain/stats.hh"

namespace kvchain {

/// \class runner
///
/// \brief runs one scenario for config::users sessions, at most
/// config::concurrency of them at the same time.
///
/// With config::shared_client, one client is made before the first session and
/// seeded into every session, it is closed after the last session completes.
/// Handles a session still holds once its chain ends are released by the
/// runner: the transaction is closed, the explicit locks are unlocked, then a
/// client of its own is closed. A failed release is logged and does not stop
/// the other releases.
class runner {
 public:
  runner(
      const config& cfg,
      stats_engine& stats,
      api::ignite_api_factory& factory);

  // the outcome of every session, ordered by user id
  future<std::vector<action_result>> run(const scenario& sc);

 private:
  future<action_result> run_session(
      scenario_context& ctx,
      const scenario& sc,
      uint64_t user,
      api::ignite_api_ptr shared);
  future<> release(const session& s, const api::ignite_api_ptr& shared);

  const config& _config;
  stats_engine& _stats;
  api::ignite_api_factory& _factory;
};

}  // namespace kvchain
