#pragma once

#include <concepts>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "kvchain/session.hh"
#include "protocol/value.hh"

namespace kvchain {

// An expression is evaluated against the session right before the operation
// it parameterizes. Evaluation failures throw util::invalid_argument.
template <typename T>
using expression = std::function<T(const session&)>;

// el parses a template such as "#{key}" or "user-#{id}". A template made of a
// single placeholder yields the attribute as is, otherwise the placeholders are
// rendered into a string. A template without placeholder is a string literal.
expression<protocol::value> el(std::string_view tmpl);

expression<protocol::value> literal(protocol::value v);

class value_expr {
 public:
  template <typename T>
    requires(
        std::constructible_from<protocol::value, T> &&
        !std::convertible_to<T, std::string_view> && !std::is_pointer_v<T> &&
        !std::is_invocable_v<T, const session&>)
  value_expr(T v) : _f(literal(protocol::value(std::move(v)))) {}
  value_expr(const char* tmpl) : _f(el(tmpl)) {}
  value_expr(const std::string& tmpl) : _f(el(tmpl)) {}
  template <typename F>
    requires(
        !std::same_as<std::remove_cvref_t<F>, value_expr> &&
        std::is_invocable_r_v<protocol::value, F, const session&>)
  value_expr(F f) : _f(std::move(f)) {}

  protocol::value operator()(const session& s) const { return _f(s); }

 private:
  expression<protocol::value> _f;
};

class entry_expr {
 public:
  entry_expr(value_expr key, value_expr val);
  template <typename F>
    requires(
        !std::same_as<std::remove_cvref_t<F>, entry_expr> &&
        std::is_invocable_r_v<protocol::entry, F, const session&>)
  entry_expr(F f) : _f(std::move(f)) {}

  protocol::entry operator()(const session& s) const { return _f(s); }

 private:
  expression<protocol::entry> _f;
};

class keys_expr {
 public:
  keys_expr(std::vector<value_expr> keys);
  keys_expr(std::initializer_list<value_expr> keys)
    : keys_expr(std::vector<value_expr>(keys)) {}
  template <typename F>
    requires(
        !std::same_as<std::remove_cvref_t<F>, keys_expr> &&
        std::is_invocable_r_v<std::vector<protocol::value>, F, const session&>)
  keys_expr(F f) : _f(std::move(f)) {}

  std::vector<protocol::value> operator()(const session& s) const {
    return _f(s);
  }

 private:
  expression<std::vector<protocol::value>> _f;
};

class entries_expr {
 public:
  entries_expr(std::vector<entry_expr> entries);
  entries_expr(std::initializer_list<entry_expr> entries)
    : entries_expr(std::vector<entry_expr>(entries)) {}
  template <typename F>
    requires(
        !std::same_as<std::remove_cvref_t<F>, entries_expr> &&
        std::is_invocable_r_v<protocol::entry_map, F, const session&>)
  entries_expr(F f) : _f(std::move(f)) {}

  protocol::entry_map operator()(const session& s) const { return _f(s); }

 private:
  expression<protocol::entry_map> _f;
};

}  // namespace kvchain
