#include "resolver.hh"

#include <seastar/core/coroutine.hh>

#include "util/error.hh"

namespace kvchain {

ignite_parameters parameter_resolver::resolve(const session& s) {
  if (!s.client()) {
    throw util::no_client_error();
  }
  return ignite_parameters{.client = s.client(), .tx = s.transaction()};
}

future<cache_parameters> parameter_resolver::resolve(
    const session& s, std::string_view cache, bool keep_binary, bool async) {
  auto p = resolve(s);
  if (async && (s.explicit_lock_used().value_or(false) || p.tx)) {
    throw util::async_conflict_error();
  }
  auto c = co_await p.client->cache(cache);
  if (keep_binary) {
    c = c->with_keep_binary();
  }
  co_return cache_parameters{.cache = std::move(c), .tx = std::move(p.tx)};
}

}  // namespace kvchain
