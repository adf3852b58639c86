#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <seastar/core/condition-variable.hh>
#include <string>

#include "api/ignite_api.hh"
#include "util/types.hh"

namespace kvchain::api {

/// \addtogroup api
/// @{

/// \class memory_cluster
///
/// \brief an in-process cluster holding named caches. One instance per shard,
/// it must outlive every client made from it.
class memory_cluster {
 public:
  struct lock_state {
    uint64_t owner = 0;
    uint64_t count = 0;
  };

  struct store {
    explicit store(protocol::cache_config cfg) : config(std::move(cfg)) {}
    DISALLOW_COPY_MOVE_AND_ASSIGN(store);

    bool transactional() const noexcept {
      return config.atomicity == protocol::cache_atomicity::transactional;
    }

    protocol::cache_config config;
    protocol::entry_map data;
    std::map<protocol::value, lock_state> locks;
    seastar::condition_variable unlocked;
  };

  memory_cluster() = default;
  DISALLOW_COPY_MOVE_AND_ASSIGN(memory_cluster);

  store* find(std::string_view name);

  store& get_or_create(const protocol::cache_config& cfg);

  uint64_t next_client_id() noexcept { return ++_client_id; }

  uint64_t next_tx_id() noexcept { return ++_tx_id; }

  size_t cache_count() const noexcept { return _caches.size(); }

 private:
  std::map<std::string, std::unique_ptr<store>, std::less<>> _caches;
  uint64_t _client_id = 0;
  uint64_t _tx_id = 0;
};

class memory_transaction final : public transaction_api {
 public:
  // nullopt marks a removal
  using write_set = std::map<protocol::value, std::optional<protocol::value>>;

  memory_transaction(
      memory_cluster& cluster, uint64_t id, protocol::tx_options opts);
  ~memory_transaction() override;

  uint64_t id() const override { return _id; }
  protocol::tx_state state() const override { return _state; }
  future<> commit() override;
  future<> rollback() override;
  future<> close() override;

  const protocol::tx_options& options() const noexcept { return _options; }

  // throws util::transaction_error if the transaction cannot be used anymore
  void check_active() const;

  // outer nullopt: the key is untouched by this transaction
  std::optional<std::optional<protocol::value>> pending(
      const std::string& cache, const protocol::value& key) const;

  void write(
      const std::string& cache,
      protocol::value key,
      std::optional<protocol::value> val);

 private:
  bool expired() const;

  memory_cluster& _cluster;
  uint64_t _id;
  protocol::tx_options _options;
  std::chrono::steady_clock::time_point _start;
  protocol::tx_state _state = protocol::tx_state::active;
  bool _closed = false;
  std::map<std::string, write_set> _writes;
};

class memory_cache final : public cache_api {
 public:
  memory_cache(
      memory_cluster::store& store, uint64_t client_id, bool keep_binary);

  const std::string& name() const override { return _store.config.name; }
  bool keep_binary() const override { return _keep_binary; }
  cache_api_ptr with_keep_binary() override;

  future<protocol::entry_map> get(
      protocol::value key, transaction_api* tx) override;
  future<protocol::entry_map> get_all(keys ks, transaction_api* tx) override;
  future<> put(
      protocol::value key, protocol::value val, transaction_api* tx) override;
  future<> put_all(protocol::entry_map m, transaction_api* tx) override;
  future<> remove(protocol::value key, transaction_api* tx) override;
  future<> remove_all(keys ks, transaction_api* tx) override;
  future<protocol::entry_map> get_and_put(
      protocol::value key, protocol::value val, transaction_api* tx) override;
  future<protocol::entry_map> get_and_remove(
      protocol::value key, transaction_api* tx) override;

  future<protocol::entry_map> get_async(protocol::value key) override;
  future<protocol::entry_map> get_all_async(keys ks) override;
  future<> put_async(protocol::value key, protocol::value val) override;
  future<> put_all_async(protocol::entry_map m) override;
  future<> remove_async(protocol::value key) override;
  future<> remove_all_async(keys ks) override;
  future<protocol::entry_map> get_and_put_async(
      protocol::value key, protocol::value val) override;
  future<protocol::entry_map> get_and_remove_async(
      protocol::value key) override;

  future<> lock(protocol::value key) override;
  future<> unlock(protocol::value key) override;

 private:
  memory_transaction* bind(transaction_api* tx) const;
  protocol::entry_map read(const keys& ks, transaction_api* tx) const;
  void write(protocol::entry_map m, transaction_api* tx);
  protocol::entry_map erase(const keys& ks, transaction_api* tx);
  protocol::entry_map encode(protocol::entry_map m) const;
  protocol::value decode(protocol::value v) const;

  memory_cluster::store& _store;
  uint64_t _client_id;
  bool _keep_binary;
};

class memory_ignite_api final : public ignite_api {
 public:
  explicit memory_ignite_api(memory_cluster& cluster);

  future<cache_api_ptr> cache(std::string_view name) override;
  future<cache_api_ptr> get_or_create_cache(
      protocol::cache_config cfg) override;
  future<transaction_api_ptr> tx_start(protocol::tx_options opts) override;
  future<> close() override;

  uint64_t id() const noexcept { return _id; }
  bool closed() const noexcept { return _closed; }

 private:
  void check_open() const;

  memory_cluster& _cluster;
  uint64_t _id;
  bool _closed = false;
};

class memory_ignite_api_factory final : public ignite_api_factory {
 public:
  explicit memory_ignite_api_factory(memory_cluster& cluster)
    : _cluster(cluster) {}
  future<ignite_api_ptr> make() override {
    return make_ready_future<ignite_api_ptr>(
        make_shared<memory_ignite_api>(_cluster));
  }

 private:
  memory_cluster& _cluster;
};

/// @}

}  // namespace kvchain::api
