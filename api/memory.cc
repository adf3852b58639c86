#include "memory.hh"

#include <seastar/core/coroutine.hh>
#include <seastar/core/future-util.hh>
#include <seastar/core/later.hh>

#include "kvchain/logger.hh"
#include "protocol/serializer.hh"
#include "util/error.hh"

namespace kvchain::api {

using namespace protocol;

memory_cluster::store* memory_cluster::find(std::string_view name) {
  auto it = _caches.find(name);
  if (it == _caches.end()) {
    return nullptr;
  }
  return it->second.get();
}

memory_cluster::store& memory_cluster::get_or_create(const cache_config& cfg) {
  auto it = _caches.find(cfg.name);
  if (it != _caches.end()) {
    return *it->second;
  }
  l.debug("memory_cluster::get_or_create: new {}", cfg);
  it = _caches.emplace(cfg.name, std::make_unique<store>(cfg)).first;
  return *it->second;
}

memory_transaction::memory_transaction(
    memory_cluster& cluster, uint64_t id, tx_options opts)
  : _cluster(cluster)
  , _id(id)
  , _options(opts)
  , _start(std::chrono::steady_clock::now()) {}

memory_transaction::~memory_transaction() {
  if (!_closed) {
    l.warn("memory_transaction: tx:{} dropped in state {}", _id, _state);
  }
}

bool memory_transaction::expired() const {
  return _options.timeout.count() > 0 &&
         std::chrono::steady_clock::now() - _start > _options.timeout;
}

void memory_transaction::check_active() const {
  if (_closed) {
    throw util::transaction_error(_id, "closed");
  }
  if (_state != tx_state::active) {
    throw util::transaction_error(
        _id, fmt::format("not active, state:{}", _state));
  }
}

std::optional<std::optional<value>> memory_transaction::pending(
    const std::string& cache, const value& key) const {
  auto wit = _writes.find(cache);
  if (wit == _writes.end()) {
    return std::nullopt;
  }
  auto it = wit->second.find(key);
  if (it == wit->second.end()) {
    return std::nullopt;
  }
  return it->second;
}

void memory_transaction::write(
    const std::string& cache, value key, std::optional<value> val) {
  _writes[cache][std::move(key)] = std::move(val);
}

future<> memory_transaction::commit() {
  check_active();
  if (expired()) {
    _state = tx_state::rolled_back;
    _writes.clear();
    throw util::transaction_error(_id, "timed out");
  }
  for (auto& [cache, writes] : _writes) {
    auto* st = _cluster.find(cache);
    if (st == nullptr) [[unlikely]] {
      throw util::cache_not_found_error(cache);
    }
    for (auto& [k, v] : writes) {
      if (v.has_value()) {
        st->data[k] = std::move(*v);
      } else {
        st->data.erase(k);
      }
    }
  }
  l.trace("memory_transaction::commit: tx:{}", _id);
  _writes.clear();
  _state = tx_state::committed;
  co_return;
}

future<> memory_transaction::rollback() {
  check_active();
  l.trace("memory_transaction::rollback: tx:{}", _id);
  _writes.clear();
  _state = tx_state::rolled_back;
  co_return;
}

future<> memory_transaction::close() {
  if (_closed) {
    co_return;
  }
  if (_state == tx_state::active) {
    l.trace("memory_transaction::close: tx:{} without commit", _id);
    _writes.clear();
    _state = tx_state::closed;
  }
  _closed = true;
  co_return;
}

memory_cache::memory_cache(
    memory_cluster::store& store, uint64_t client_id, bool keep_binary)
  : _store(store), _client_id(client_id), _keep_binary(keep_binary) {}

cache_api_ptr memory_cache::with_keep_binary() {
  return make_shared<memory_cache>(_store, _client_id, true);
}

memory_transaction* memory_cache::bind(transaction_api* tx) const {
  // an atomic cache ignores the ambient transaction
  if (tx == nullptr || !_store.transactional()) {
    return nullptr;
  }
  auto* mtx = dynamic_cast<memory_transaction*>(tx);
  if (mtx == nullptr) [[unlikely]] {
    throw util::invalid_argument("tx", "not started by a memory cluster");
  }
  mtx->check_active();
  return mtx;
}

entry_map memory_cache::read(const keys& ks, transaction_api* tx) const {
  auto* mtx = bind(tx);
  entry_map result;
  for (const auto& k : ks) {
    if (mtx != nullptr) {
      if (auto p = mtx->pending(name(), k); p.has_value()) {
        if (p->has_value()) {
          result.emplace(k, **p);
        }
        continue;
      }
    }
    if (auto it = _store.data.find(k); it != _store.data.end()) {
      result.emplace(k, it->second);
    }
  }
  return result;
}

void memory_cache::write(entry_map m, transaction_api* tx) {
  auto* mtx = bind(tx);
  for (auto& [k, v] : m) {
    if (v.is_null()) {
      throw util::invalid_argument("value", "null is not allowed");
    }
  }
  for (auto& [k, v] : m) {
    if (mtx != nullptr) {
      mtx->write(name(), k, decode(v));
    } else {
      _store.data[k] = decode(v);
    }
  }
}

entry_map memory_cache::erase(const keys& ks, transaction_api* tx) {
  auto* mtx = bind(tx);
  auto removed = read(ks, tx);
  for (const auto& k : ks) {
    if (mtx != nullptr) {
      mtx->write(name(), k, std::nullopt);
    } else {
      _store.data.erase(k);
    }
  }
  return removed;
}

entry_map memory_cache::encode(entry_map m) const {
  if (!_keep_binary) {
    return m;
  }
  return to_binary(m);
}

value memory_cache::decode(value v) const {
  if (!_keep_binary) {
    return v;
  }
  return from_binary_value(v);
}

future<entry_map> memory_cache::get(value key, transaction_api* tx) {
  return futurize_invoke([this, &key, tx] { return encode(read({key}, tx)); });
}

future<entry_map> memory_cache::get_all(keys ks, transaction_api* tx) {
  return futurize_invoke([this, &ks, tx] { return encode(read(ks, tx)); });
}

future<> memory_cache::put(value key, value val, transaction_api* tx) {
  return futurize_invoke([this, &key, &val, tx] {
    write(entry_map{{std::move(key), std::move(val)}}, tx);
  });
}

future<> memory_cache::put_all(entry_map m, transaction_api* tx) {
  return futurize_invoke([this, &m, tx] { write(std::move(m), tx); });
}

future<> memory_cache::remove(value key, transaction_api* tx) {
  return futurize_invoke([this, &key, tx] { erase({key}, tx); });
}

future<> memory_cache::remove_all(keys ks, transaction_api* tx) {
  return futurize_invoke([this, &ks, tx] { erase(ks, tx); });
}

future<entry_map> memory_cache::get_and_put(
    value key, value val, transaction_api* tx) {
  return futurize_invoke([this, &key, &val, tx] {
    auto previous = read({key}, tx);
    write(entry_map{{std::move(key), std::move(val)}}, tx);
    return encode(std::move(previous));
  });
}

future<entry_map> memory_cache::get_and_remove(value key, transaction_api* tx) {
  return futurize_invoke(
      [this, &key, tx] { return encode(erase({key}, tx)); });
}

future<entry_map> memory_cache::get_async(value key) {
  co_await seastar::yield();
  co_return co_await get(std::move(key), nullptr);
}

future<entry_map> memory_cache::get_all_async(keys ks) {
  co_await seastar::yield();
  co_return co_await get_all(std::move(ks), nullptr);
}

future<> memory_cache::put_async(value key, value val) {
  co_await seastar::yield();
  co_await put(std::move(key), std::move(val), nullptr);
}

future<> memory_cache::put_all_async(entry_map m) {
  co_await seastar::yield();
  co_await put_all(std::move(m), nullptr);
}

future<> memory_cache::remove_async(value key) {
  co_await seastar::yield();
  co_await remove(std::move(key), nullptr);
}

future<> memory_cache::remove_all_async(keys ks) {
  co_await seastar::yield();
  co_await remove_all(std::move(ks), nullptr);
}

future<entry_map> memory_cache::get_and_put_async(value key, value val) {
  co_await seastar::yield();
  co_return co_await get_and_put(std::move(key), std::move(val), nullptr);
}

future<entry_map> memory_cache::get_and_remove_async(value key) {
  co_await seastar::yield();
  co_return co_await get_and_remove(std::move(key), nullptr);
}

future<> memory_cache::lock(value key) {
  co_await _store.unlocked.wait([this, &key] {
    auto it = _store.locks.find(key);
    return it == _store.locks.end() || it->second.owner == _client_id;
  });
  auto& state = _store.locks[key];
  state.owner = _client_id;
  state.count++;
  l.trace(
      "memory_cache::lock: {}[{}] by client:{}, count:{}",
      name(),
      key,
      _client_id,
      state.count);
}

future<> memory_cache::unlock(value key) {
  auto it = _store.locks.find(key);
  if (it == _store.locks.end() || it->second.owner != _client_id) {
    throw util::operation_error(fmt::format(
        "lock {}[{}] is not held by client:{}", name(), key, _client_id));
  }
  if (--it->second.count == 0) {
    _store.locks.erase(it);
    _store.unlocked.broadcast();
  }
  co_return;
}

memory_ignite_api::memory_ignite_api(memory_cluster& cluster)
  : _cluster(cluster), _id(cluster.next_client_id()) {}

void memory_ignite_api::check_open() const {
  if (_closed) {
    throw util::closed_error(fmt::format("client:{}", _id));
  }
}

future<cache_api_ptr> memory_ignite_api::cache(std::string_view name) {
  check_open();
  auto* st = _cluster.find(name);
  if (st == nullptr) {
    throw util::cache_not_found_error(name);
  }
  co_return make_shared<memory_cache>(*st, _id, false);
}

future<cache_api_ptr> memory_ignite_api::get_or_create_cache(
    cache_config cfg) {
  check_open();
  auto& st = _cluster.get_or_create(cfg);
  co_return make_shared<memory_cache>(st, _id, false);
}

future<transaction_api_ptr> memory_ignite_api::tx_start(tx_options opts) {
  check_open();
  auto id = _cluster.next_tx_id();
  l.trace("memory_ignite_api::tx_start: client:{}, tx:{}, {}", _id, id, opts);
  co_return make_shared<memory_transaction>(_cluster, id, opts);
}

future<> memory_ignite_api::close() {
  _closed = true;
  co_return;
}

}  // namespace kvchain::api
