#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "kvchain/config.hh"
#include "kvchain/expression.hh"
#include "kvchain/session.hh"
#include "protocol/value.hh"

namespace kvchain {

struct check_outcome {
  // the reason of the failure, nullopt if the check holds
  std::optional<std::string> failure;
  // what the check extracted from the result, nullopt if nothing was found
  std::optional<session::slot> extracted;
  // the slot to write into the session once every check of the action holds
  std::optional<std::pair<std::string, session::slot>> saved;
};

/// \class check
///
/// \brief an assertion or extraction over the result of one cache operation.
class check {
 public:
  using function = std::function<check_outcome(
      const protocol::entry_map& result, const session& s)>;

  check(std::string description, function fn);

  const std::string& description() const noexcept { return _description; }

  // evaluation failures of the expected values are reported as failures
  check_outcome operator()(
      const protocol::entry_map& result, const session& s) const;

  // save_as additionally saves the extracted data, a check extracting nothing
  // fails
  check save_as(std::string name) const;

 private:
  std::string _description;
  function _fn;
};

template <typename T>
using extractor = std::function<std::optional<T>(
    const protocol::entry_map& result, const session& s)>;

class value_check_builder {
 public:
  value_check_builder(std::string description, extractor<protocol::value> ex);

  check is(value_expr expected) const;
  check is_null() const;
  check not_null() const;
  check exists() const;
  check not_exists() const;
  check validate(
      std::function<bool(const protocol::value&, const session&)> fn) const;
  check save_as(std::string name) const;

 private:
  std::string _description;
  extractor<protocol::value> _ex;
};

class count_check_builder {
 public:
  check is(uint64_t n) const;
  check gt(uint64_t n) const;
  check lt(uint64_t n) const;
  check save_as(std::string name) const;
};

class find_check_builder {
 public:
  find_check_builder(std::string description, extractor<protocol::entry> ex);

  check exists() const;
  check not_exists() const;
  check is(entry_expr expected) const;
  check save_as(std::string name) const;
  check validate(
      std::function<bool(const protocol::entry&, const session&)> fn) const;
  value_check_builder transform(
      std::function<protocol::value(const protocol::entry&)> fn) const;

  // a bare find is an existence check
  operator check() const { return exists(); }

 private:
  std::string _description;
  extractor<protocol::entry> _ex;
};

class find_all_check_builder {
 public:
  check is(entries_expr expected) const;
  check exists() const;
  check save_as(std::string name) const;
};

class entries_check_builder {
 public:
  count_check_builder count() const { return {}; }

  // the only entry of the result, a result of several entries is ambiguous
  find_check_builder find() const;
  find_check_builder find(size_t index) const;
  find_check_builder find_key(value_expr key) const;
  find_all_check_builder find_all() const { return {}; }

  check exists() const { return find().exists(); }
  check not_exists() const { return find().not_exists(); }

  operator check() const { return exists(); }
};

class map_check_builder {
 public:
  value_check_builder transform(
      std::function<protocol::value(const protocol::entry_map&)> fn) const;
  check validate(
      std::function<bool(const protocol::entry_map&, const session&)> fn) const;
  check save_as(std::string name) const;
};

entries_check_builder entries();

map_check_builder map_result();

struct check_report {
  session s;
  std::vector<std::string> failures;

  bool ok() const noexcept { return failures.empty(); }
  // the failures joined by "; "
  std::string message() const;
};

// run_checks evaluates the checks in declaration order and folds the saved
// slots into the session. The session is only meaningful if every check holds.
check_report run_checks(
    const std::vector<check>& checks,
    const protocol::entry_map& result,
    session s,
    check_policy policy);

}  // namespace kvchain
