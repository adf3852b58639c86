#include "cache_action.hh"

#include <seastar/core/coroutine.hh>

#include "kvchain/logger.hh"

namespace kvchain {

using namespace protocol;

namespace {

future<entry_map> nothing(future<> f) {
  return f.then([] { return entry_map{}; });
}

}  // namespace

cache_action::cache_action(
    std::string type, std::string cache, cache_options opts)
  : action(std::move(type), std::move(cache), std::move(opts.name))
  , _checks(std::move(opts.checks))
  , _async(opts.async)
  , _keep_binary(opts.keep_binary) {}

future<cache_parameters> cache_action::resolve(const session& s) const {
  return parameter_resolver::resolve(s, cache(), _keep_binary, _async);
}

get_action::get_action(std::string cache, value_expr key, cache_options opts)
  : cache_action("get", std::move(cache), std::move(opts))
  , _key(std::move(key)) {}

future<action_result> get_action::do_execute(
    scenario_context& ctx, session s) {
  auto p = co_await resolve(s);
  auto key = _key(s);
  co_return co_await report(
      ctx,
      std::move(s),
      checks(),
      [p = std::move(p), key = std::move(key), async = async()]() mutable {
        if (async) {
          return p.cache->get_async(std::move(key));
        }
        return p.cache->get(std::move(key), p.tx.get());
      });
}

get_all_action::get_all_action(
    std::string cache, keys_expr keys, cache_options opts)
  : cache_action("getAll", std::move(cache), std::move(opts))
  , _keys(std::move(keys)) {}

future<action_result> get_all_action::do_execute(
    scenario_context& ctx, session s) {
  auto p = co_await resolve(s);
  auto keys = _keys(s);
  co_return co_await report(
      ctx,
      std::move(s),
      checks(),
      [p = std::move(p), keys = std::move(keys), async = async()]() mutable {
        if (async) {
          return p.cache->get_all_async(std::move(keys));
        }
        return p.cache->get_all(std::move(keys), p.tx.get());
      });
}

put_action::put_action(std::string cache, entry_expr e, cache_options opts)
  : cache_action("put", std::move(cache), std::move(opts))
  , _entry(std::move(e)) {}

future<action_result> put_action::do_execute(
    scenario_context& ctx, session s) {
  auto p = co_await resolve(s);
  auto e = _entry(s);
  co_return co_await report(
      ctx,
      std::move(s),
      checks(),
      [p = std::move(p), e = std::move(e), async = async()]() mutable {
        if (async) {
          return nothing(
              p.cache->put_async(std::move(e.key), std::move(e.val)));
        }
        return nothing(
            p.cache->put(std::move(e.key), std::move(e.val), p.tx.get()));
      });
}

put_all_action::put_all_action(
    std::string cache, entries_expr entries, cache_options opts)
  : cache_action("putAll", std::move(cache), std::move(opts))
  , _entries(std::move(entries)) {}

future<action_result> put_all_action::do_execute(
    scenario_context& ctx, session s) {
  auto p = co_await resolve(s);
  auto m = _entries(s);
  co_return co_await report(
      ctx,
      std::move(s),
      checks(),
      [p = std::move(p), m = std::move(m), async = async()]() mutable {
        if (async) {
          return nothing(p.cache->put_all_async(std::move(m)));
        }
        return nothing(p.cache->put_all(std::move(m), p.tx.get()));
      });
}

remove_action::remove_action(
    std::string cache, value_expr key, cache_options opts)
  : cache_action("remove", std::move(cache), std::move(opts))
  , _key(std::move(key)) {}

future<action_result> remove_action::do_execute(
    scenario_context& ctx, session s) {
  auto p = co_await resolve(s);
  auto key = _key(s);
  co_return co_await report(
      ctx,
      std::move(s),
      checks(),
      [p = std::move(p), key = std::move(key), async = async()]() mutable {
        if (async) {
          return nothing(p.cache->remove_async(std::move(key)));
        }
        return nothing(p.cache->remove(std::move(key), p.tx.get()));
      });
}

remove_all_action::remove_all_action(
    std::string cache, keys_expr keys, cache_options opts)
  : cache_action("removeAll", std::move(cache), std::move(opts))
  , _keys(std::move(keys)) {}

future<action_result> remove_all_action::do_execute(
    scenario_context& ctx, session s) {
  auto p = co_await resolve(s);
  auto keys = _keys(s);
  co_return co_await report(
      ctx,
      std::move(s),
      checks(),
      [p = std::move(p), keys = std::move(keys), async = async()]() mutable {
        if (async) {
          return nothing(p.cache->remove_all_async(std::move(keys)));
        }
        return nothing(p.cache->remove_all(std::move(keys), p.tx.get()));
      });
}

get_and_put_action::get_and_put_action(
    std::string cache, entry_expr e, cache_options opts)
  : cache_action("getAndPut", std::move(cache), std::move(opts))
  , _entry(std::move(e)) {}

future<action_result> get_and_put_action::do_execute(
    scenario_context& ctx, session s) {
  auto p = co_await resolve(s);
  auto e = _entry(s);
  co_return co_await report(
      ctx,
      std::move(s),
      checks(),
      [p = std::move(p), e = std::move(e), async = async()]() mutable {
        if (async) {
          return p.cache->get_and_put_async(std::move(e.key), std::move(e.val));
        }
        return p.cache->get_and_put(
            std::move(e.key), std::move(e.val), p.tx.get());
      });
}

get_and_remove_action::get_and_remove_action(
    std::string cache, value_expr key, cache_options opts)
  : cache_action("getAndRemove", std::move(cache), std::move(opts))
  , _key(std::move(key)) {}

future<action_result> get_and_remove_action::do_execute(
    scenario_context& ctx, session s) {
  auto p = co_await resolve(s);
  auto key = _key(s);
  co_return co_await report(
      ctx,
      std::move(s),
      checks(),
      [p = std::move(p), key = std::move(key), async = async()]() mutable {
        if (async) {
          return p.cache->get_and_remove_async(std::move(key));
        }
        return p.cache->get_and_remove(std::move(key), p.tx.get());
      });
}

lock_action::lock_action(std::string cache, value_expr key, cache_options opts)
  : cache_action(
        "lock", std::move(cache), (opts.async = false, std::move(opts)))
  , _key(std::move(key)) {}

future<action_result> lock_action::do_execute(
    scenario_context& ctx, session s) {
  auto p = co_await resolve(s);
  auto key = _key(s);
  // the lock is held once acquired, whatever the checks say
  bool locked = false;
  auto r = co_await report(
      ctx,
      std::move(s),
      checks(),
      [p = std::move(p), key, &locked]() mutable {
        return p.cache->lock(std::move(key)).then([&locked] {
          locked = true;
          return entry_map{};
        });
      });
  if (locked) {
    r.s = r.s.with_explicit_lock_used().with_lock(cache(), std::move(key));
  }
  co_return r;
}

unlock_action::unlock_action(
    std::string cache, value_expr key, cache_options opts)
  : cache_action(
        "unlock", std::move(cache), (opts.async = false, std::move(opts)))
  , _key(std::move(key)) {}

future<action_result> unlock_action::do_execute(
    scenario_context& ctx, session s) {
  auto p = co_await resolve(s);
  auto key = _key(s);
  bool unlocked = false;
  auto r = co_await report(
      ctx,
      std::move(s),
      checks(),
      [p = std::move(p), key, &unlocked]() mutable {
        return p.cache->unlock(std::move(key)).then([&unlocked] {
          unlocked = true;
          return entry_map{};
        });
      });
  if (unlocked) {
    r.s = r.s.without_lock(cache(), key);
  }
  co_return r;
}

future<> release_locks(
    api::ignite_api_ptr client, std::vector<session::held_lock> locks) {
  for (auto it = locks.rbegin(); it != locks.rend(); ++it) {
    try {
      auto cache = co_await client->cache(it->cache);
      co_await cache->unlock(it->key);
    } catch (const std::exception& ex) {
      l.warn(
          "release_locks: {}[{}] not released, {}",
          it->cache,
          it->key,
          ex.what());
    }
  }
}

}  // namespace kvchain
