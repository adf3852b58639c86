#pragma once

#include <seastar/core/future.hh>
#include <seastar/core/shared_ptr.hh>
#include <string>
#include <string_view>
#include <vector>

#include "protocol/cache.hh"
#include "protocol/value.hh"
#include "util/seastarx.hh"

namespace kvchain::api {

/// \defgroup api Capability Handles

/// \addtogroup api
/// @{

class cache_api;
class transaction_api;
class ignite_api;

using cache_api_ptr = shared_ptr<cache_api>;
using transaction_api_ptr = shared_ptr<transaction_api>;
using ignite_api_ptr = shared_ptr<ignite_api>;

/// \class transaction_api
///
/// \brief a transaction begun by an \ref ignite_api. It is exclusively owned by
/// the session that started it.
class transaction_api {
 public:
  virtual ~transaction_api() = default;

  virtual uint64_t id() const = 0;

  virtual protocol::tx_state state() const = 0;

  /// commit makes the buffered writes visible. Fails if the transaction is no
  /// longer active.
  virtual future<> commit() = 0;

  /// rollback discards the buffered writes. Fails if the transaction is no
  /// longer active.
  virtual future<> rollback() = 0;

  /// close releases the transaction, an active transaction is rolled back.
  /// Closing an already closed transaction is a no-op.
  virtual future<> close() = 0;
};

/// \class cache_api
///
/// \brief a named cache of a cluster.
///
/// The plain operations are synchronous: the returned future is resolved
/// before the call returns. They accept the transaction of the calling session,
/// a null handle means running outside of any transaction. The `_async`
/// operations may complete on a later reactor task and therefore never take a
/// transaction.
class cache_api {
 public:
  using keys = std::vector<protocol::value>;

  virtual ~cache_api() = default;

  virtual const std::string& name() const = 0;

  virtual bool keep_binary() const = 0;

  /// with_keep_binary returns a view of the same cache whose operations return
  /// values in their binary form and accept binary values.
  virtual cache_api_ptr with_keep_binary() = 0;

  virtual future<protocol::entry_map> get(
      protocol::value key, transaction_api* tx) = 0;
  virtual future<protocol::entry_map> get_all(keys ks, transaction_api* tx) = 0;
  virtual future<> put(
      protocol::value key, protocol::value val, transaction_api* tx) = 0;
  virtual future<> put_all(protocol::entry_map m, transaction_api* tx) = 0;
  virtual future<> remove(protocol::value key, transaction_api* tx) = 0;
  virtual future<> remove_all(keys ks, transaction_api* tx) = 0;
  /// get_and_put returns the previous entry of the key, if any.
  virtual future<protocol::entry_map> get_and_put(
      protocol::value key, protocol::value val, transaction_api* tx) = 0;
  /// get_and_remove returns the removed entry of the key, if any.
  virtual future<protocol::entry_map> get_and_remove(
      protocol::value key, transaction_api* tx) = 0;

  virtual future<protocol::entry_map> get_async(protocol::value key) = 0;
  virtual future<protocol::entry_map> get_all_async(keys ks) = 0;
  virtual future<> put_async(protocol::value key, protocol::value val) = 0;
  virtual future<> put_all_async(protocol::entry_map m) = 0;
  virtual future<> remove_async(protocol::value key) = 0;
  virtual future<> remove_all_async(keys ks) = 0;
  virtual future<protocol::entry_map> get_and_put_async(
      protocol::value key, protocol::value val) = 0;
  virtual future<protocol::entry_map> get_and_remove_async(
      protocol::value key) = 0;

  /// lock acquires the explicit lock of the key, waiting until the current
  /// holder releases it. Locks are reentrant for the same client.
  virtual future<> lock(protocol::value key) = 0;
  virtual future<> unlock(protocol::value key) = 0;
};

/// \class ignite_api
///
/// \brief the top-level client handle, may be shared by many sessions.
class ignite_api {
 public:
  virtual ~ignite_api() = default;

  /// cache looks up an existing cache, fails with util::cache_not_found_error.
  virtual future<cache_api_ptr> cache(std::string_view name) = 0;

  virtual future<cache_api_ptr> get_or_create_cache(
      protocol::cache_config cfg) = 0;

  virtual future<transaction_api_ptr> tx_start(protocol::tx_options opts) = 0;

  virtual future<> close() = 0;
};

class ignite_api_factory {
 public:
  virtual future<ignite_api_ptr> make() = 0;
  virtual ~ignite_api_factory() = default;
};

/// @}

}  // namespace kvchain::api
