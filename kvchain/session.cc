#include "session.hh"

#include <algorithm>

#include "util/error.hh"

namespace kvchain {

session::session(uint64_t user_id, std::string scenario)
  : _user_id(user_id), _scenario(std::move(scenario)) {}

session session::with_client(api::ignite_api_ptr client) const {
  auto s = *this;
  s._client = std::move(client);
  return s;
}

session session::without_client() const {
  auto s = *this;
  s._client = nullptr;
  return s;
}

session session::with_transaction(api::transaction_api_ptr tx) const {
  auto s = *this;
  s._transaction = std::move(tx);
  return s;
}

session session::without_transaction() const {
  auto s = *this;
  s._transaction = nullptr;
  return s;
}

session session::with_explicit_lock_used() const {
  auto s = *this;
  s._explicit_lock_used = true;
  return s;
}

session session::with_lock(std::string cache, protocol::value key) const {
  auto s = *this;
  s._locks.push_back(
      held_lock{.cache = std::move(cache), .key = std::move(key)});
  return s;
}

session session::without_lock(
    std::string_view cache, const protocol::value& key) const {
  auto s = *this;
  auto it = std::find_if(s._locks.rbegin(), s._locks.rend(), [&](auto& h) {
    return h.cache == cache && h.key == key;
  });
  if (it != s._locks.rend()) {
    s._locks.erase(std::next(it).base());
  }
  return s;
}

session session::without_locks() const {
  auto s = *this;
  s._locks.clear();
  return s;
}

bool session::contains(std::string_view name) const {
  return _slots.find(name) != _slots.end();
}

const session::slot* session::get(std::string_view name) const {
  auto it = _slots.find(name);
  if (it == _slots.end()) {
    return nullptr;
  }
  return &it->second;
}

const protocol::value& session::value(std::string_view name) const {
  const auto* s = get(name);
  if (s == nullptr) {
    throw util::invalid_argument(name, "no attribute named in session");
  }
  const auto* v = std::get_if<protocol::value>(s);
  if (v == nullptr) {
    throw util::invalid_argument(name, "attribute is not a plain value");
  }
  return *v;
}

session session::set(std::string name, slot v) const {
  auto s = *this;
  s._slots.insert_or_assign(std::move(name), std::move(v));
  return s;
}

session session::remove(std::string_view name) const {
  auto s = *this;
  if (auto it = s._slots.find(name); it != s._slots.end()) {
    s._slots.erase(it);
  }
  return s;
}

session session::mark_as_failed() const {
  auto s = *this;
  s._failed = true;
  return s;
}

session session::mark_as_succeeded() const {
  auto s = *this;
  s._failed = false;
  return s;
}

session session::enter_group(std::string name) const {
  auto s = *this;
  s._groups.emplace_back(std::move(name));
  return s;
}

session session::exit_group() const {
  auto s = *this;
  if (!s._groups.empty()) {
    s._groups.pop_back();
  }
  return s;
}

std::ostream& operator<<(std::ostream& os, const session::slot& s) {
  std::visit([&os](const auto& v) { os << v; }, s);
  return os;
}

std::ostream& operator<<(std::ostream& os, const session& s) {
  os << "session[user:" << s._user_id << ", scenario:" << s._scenario
     << ", client:" << (s._client ? "set" : "unset")
     << ", tx:" << (s._transaction ? "active" : "none") << ", lock:";
  if (s._explicit_lock_used.has_value()) {
    os << *s._explicit_lock_used;
  } else {
    os << "unset";
  }
  os << ", locks:" << s._locks.size() << ", failed:" << s._failed
     << ", slots:{";
  bool first = true;
  for (const auto& [name, slot] : s._slots) {
    os << (first ? "" : ", ") << name << ": " << slot;
    first = false;
  }
  return os << "}]";
}

}  // namespace kvchain
