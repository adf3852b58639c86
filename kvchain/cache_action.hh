#pragma once

#include "kvchain/action.hh"
#include "kvchain/expression.hh"
#include "kvchain/resolver.hh"

namespace kvchain {

struct cache_options {
  std::vector<check> checks;
  // generated as "<type> <cache>" if empty
  std::string name;
  bool async = false;
  bool keep_binary = false;
};

class cache_action : public action {
 public:
  cache_action(std::string type, std::string cache, cache_options opts);

  const std::string& cache() const noexcept { return resource(); }
  bool async() const noexcept { return _async; }
  bool keep_binary() const noexcept { return _keep_binary; }
  const std::vector<check>& checks() const noexcept { return _checks; }

 protected:
  future<cache_parameters> resolve(const session& s) const;

 private:
  std::vector<check> _checks;
  bool _async;
  bool _keep_binary;
};

class get_action final : public cache_action {
 public:
  get_action(std::string cache, value_expr key, cache_options opts);

 protected:
  future<action_result> do_execute(scenario_context& ctx, session s) override;

 private:
  value_expr _key;
};

class get_all_action final : public cache_action {
 public:
  get_all_action(std::string cache, keys_expr keys, cache_options opts);

 protected:
  future<action_result> do_execute(scenario_context& ctx, session s) override;

 private:
  keys_expr _keys;
};

class put_action final : public cache_action {
 public:
  put_action(std::string cache, entry_expr e, cache_options opts);

 protected:
  future<action_result> do_execute(scenario_context& ctx, session s) override;

 private:
  entry_expr _entry;
};

class put_all_action final : public cache_action {
 public:
  put_all_action(std::string cache, entries_expr entries, cache_options opts);

 protected:
  future<action_result> do_execute(scenario_context& ctx, session s) override;

 private:
  entries_expr _entries;
};

class remove_action final : public cache_action {
 public:
  remove_action(std::string cache, value_expr key, cache_options opts);

 protected:
  future<action_result> do_execute(scenario_context& ctx, session s) override;

 private:
  value_expr _key;
};

class remove_all_action final : public cache_action {
 public:
  remove_all_action(std::string cache, keys_expr keys, cache_options opts);

 protected:
  future<action_result> do_execute(scenario_context& ctx, session s) override;

 private:
  keys_expr _keys;
};

class get_and_put_action final : public cache_action {
 public:
  get_and_put_action(std::string cache, entry_expr e, cache_options opts);

 protected:
  future<action_result> do_execute(scenario_context& ctx, session s) override;

 private:
  entry_expr _entry;
};

class get_and_remove_action final : public cache_action {
 public:
  get_and_remove_action(std::string cache, value_expr key, cache_options opts);

 protected:
  future<action_result> do_execute(scenario_context& ctx, session s) override;

 private:
  value_expr _key;
};

// lock is always synchronous, an acquired lock vetoes the async operations
// for the rest of the chain and is recorded in the session until unlocked
class lock_action final : public cache_action {
 public:
  lock_action(std::string cache, value_expr key, cache_options opts);

 protected:
  future<action_result> do_execute(scenario_context& ctx, session s) override;

 private:
  value_expr _key;
};

class unlock_action final : public cache_action {
 public:
  unlock_action(std::string cache, value_expr key, cache_options opts);

 protected:
  future<action_result> do_execute(scenario_context& ctx, session s) override;

 private:
  value_expr _key;
};

// release_locks unlocks the given locks through the client in the reverse
// order of acquisition. Failures are logged and never thrown.
future<> release_locks(
    api::ignite_api_ptr client, std::vector<session::held_lock> locks);

}  // namespace kvchain
