#pragma once

#include <seastar/core/future.hh>
#include <string_view>

#include "api/ignite_api.hh"
#include "kvchain/session.hh"

namespace kvchain {

struct ignite_parameters {
  api::ignite_api_ptr client;
  // null outside of transactions
  api::transaction_api_ptr tx;
};

struct cache_parameters {
  api::cache_api_ptr cache;
  // null outside of transactions
  api::transaction_api_ptr tx;
};

/// \class parameter_resolver
///
/// \brief derives the capability handles of an action from the session.
/// Failures are util::resolution_error and no operation is attempted.
class parameter_resolver {
 public:
  // throws util::no_client_error
  static ignite_parameters resolve(const session& s);

  // fails with util::no_client_error, util::async_conflict_error or the lookup
  // error of the cache
  static future<cache_parameters> resolve(
      const session& s, std::string_view cache, bool keep_binary, bool async);
};

}  // namespace kvchain
