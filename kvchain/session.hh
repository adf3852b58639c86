#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "api/ignite_api.hh"
#include "protocol/value.hh"
#include "util/types.hh"

namespace kvchain {

/// \class session
///
/// \brief the state of one simulated user threaded through its action chain.
///
/// A session is immutable in representation: every with_xxx / without_xxx
/// method returns an updated copy and leaves the receiver untouched. A session
/// is exclusively owned by the chain running it.
class session {
 public:
  using slot =
      std::variant<protocol::value, protocol::entry, std::vector<protocol::entry>>;

  session(uint64_t user_id, std::string scenario);
  DEFAULT_COPY_MOVE_AND_ASSIGN(session);

  uint64_t user_id() const noexcept { return _user_id; }
  const std::string& scenario() const noexcept { return _scenario; }

  // client, a null pointer if no client has been set
  const api::ignite_api_ptr& client() const noexcept { return _client; }
  session with_client(api::ignite_api_ptr client) const;
  session without_client() const;

  // the active transaction, a null pointer outside of transactions
  const api::transaction_api_ptr& transaction() const noexcept {
    return _transaction;
  }
  session with_transaction(api::transaction_api_ptr tx) const;
  session without_transaction() const;

  // unset until an explicit lock is acquired in this chain
  std::optional<bool> explicit_lock_used() const noexcept {
    return _explicit_lock_used;
  }
  session with_explicit_lock_used() const;

  // an explicit lock acquired by this session and not released yet
  struct held_lock {
    std::string cache;
    protocol::value key;

    bool operator==(const held_lock&) const = default;
  };

  // held locks in acquisition order, a reentrant lock appears once per lock
  const std::vector<held_lock>& locks() const noexcept { return _locks; }
  session with_lock(std::string cache, protocol::value key) const;
  // drops the latest acquisition of the lock, if any
  session without_lock(
      std::string_view cache, const protocol::value& key) const;
  session without_locks() const;

  // named slots
  bool contains(std::string_view name) const;
  const slot* get(std::string_view name) const;
  // throws util::invalid_argument if the slot is missing or holds another kind
  const protocol::value& value(std::string_view name) const;
  session set(std::string name, slot s) const;
  session remove(std::string_view name) const;
  const std::map<std::string, slot, std::less<>>& slots() const noexcept {
    return _slots;
  }

  bool failed() const noexcept { return _failed; }
  session mark_as_failed() const;
  session mark_as_succeeded() const;

  // enclosing group names, outermost first
  const std::vector<std::string>& groups() const noexcept { return _groups; }
  session enter_group(std::string name) const;
  session exit_group() const;

  friend std::ostream& operator<<(std::ostream& os, const session& s);

 private:
  uint64_t _user_id = 0;
  std::string _scenario;
  api::ignite_api_ptr _client;
  api::transaction_api_ptr _transaction;
  std::optional<bool> _explicit_lock_used;
  std::vector<held_lock> _locks;
  std::map<std::string, slot, std::less<>> _slots;
  bool _failed = false;
  std::vector<std::string> _groups;
};

std::ostream& operator<<(std::ostream& os, const session::slot& s);

}  // namespace kvchain

template <>
struct fmt::formatter<kvchain::session> : fmt::ostream_formatter {};
