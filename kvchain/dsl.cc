#include "dsl.hh"

namespace kvchain::dsl {

action_ptr get(std::string cache, value_expr key, cache_options opts) {
  return std::make_unique<get_action>(
      std::move(cache), std::move(key), std::move(opts));
}

action_ptr get_all(std::string cache, keys_expr keys, cache_options opts) {
  return std::make_unique<get_all_action>(
      std::move(cache), std::move(keys), std::move(opts));
}

action_ptr put(std::string cache, entry_expr e, cache_options opts) {
  return std::make_unique<put_action>(
      std::move(cache), std::move(e), std::move(opts));
}

action_ptr put_all(std::string cache, entries_expr entries, cache_options opts) {
  return std::make_unique<put_all_action>(
      std::move(cache), std::move(entries), std::move(opts));
}

action_ptr remove(std::string cache, value_expr key, cache_options opts) {
  return std::make_unique<remove_action>(
      std::move(cache), std::move(key), std::move(opts));
}

action_ptr remove_all(std::string cache, keys_expr keys, cache_options opts) {
  return std::make_unique<remove_all_action>(
      std::move(cache), std::move(keys), std::move(opts));
}

action_ptr get_and_put(std::string cache, entry_expr e, cache_options opts) {
  return std::make_unique<get_and_put_action>(
      std::move(cache), std::move(e), std::move(opts));
}

action_ptr get_and_remove(
    std::string cache, value_expr key, cache_options opts) {
  return std::make_unique<get_and_remove_action>(
      std::move(cache), std::move(key), std::move(opts));
}

action_ptr lock(std::string cache, value_expr key, cache_options opts) {
  return std::make_unique<lock_action>(
      std::move(cache), std::move(key), std::move(opts));
}

action_ptr unlock(std::string cache, value_expr key, cache_options opts) {
  return std::make_unique<unlock_action>(
      std::move(cache), std::move(key), std::move(opts));
}

action_ptr tx_start(std::optional<protocol::tx_options> opts, std::string name) {
  return std::make_unique<tx_begin_action>(opts, std::move(name));
}

action_ptr commit(std::string name) {
  return std::make_unique<tx_commit_action>(std::move(name));
}

action_ptr rollback(std::string name) {
  return std::make_unique<tx_rollback_action>(std::move(name));
}

action_ptr tx_close(std::string name) {
  return std::make_unique<tx_close_action>(std::move(name));
}

action_ptr start_client(std::string name) {
  return std::make_unique<start_client_action>(std::move(name));
}

action_ptr close_client(std::string name) {
  return std::make_unique<close_client_action>(std::move(name));
}

action_ptr create_cache(protocol::cache_config cfg, std::string name) {
  return std::make_unique<create_cache_action>(std::move(cfg), std::move(name));
}

action_ptr tx(chain body, std::optional<protocol::tx_options> opts) {
  return std::make_unique<tx_scope_action>(std::move(body), opts);
}

action_ptr group(std::string name, chain body) {
  return std::make_unique<group_action>(std::move(name), std::move(body));
}

}  // namespace kvchain::dsl
