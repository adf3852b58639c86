#include "check.hh"

#include <fmt/ostream.h>

#include <iterator>

#include "util/error.hh"

namespace kvchain {

using namespace protocol;

namespace {

check_outcome pass(std::optional<session::slot> extracted = std::nullopt) {
  return check_outcome{.extracted = std::move(extracted)};
}

check_outcome fail(std::string reason) {
  return check_outcome{.failure = std::move(reason)};
}

template <typename T>
std::string found(const std::optional<T>& v) {
  if (!v.has_value()) {
    return "nothing";
  }
  return fmt::format("{}", fmt::streamed(*v));
}

template <typename T>
std::optional<session::slot> to_slot(std::optional<T> v) {
  if (!v.has_value()) {
    return std::nullopt;
  }
  return session::slot{std::move(*v)};
}

}  // namespace

check::check(std::string description, function fn)
  : _description(std::move(description)), _fn(std::move(fn)) {}

check_outcome check::operator()(
    const entry_map& result, const session& s) const {
  try {
    auto outcome = _fn(result, s);
    if (outcome.failure.has_value()) {
      outcome.failure = fmt::format("{}, {}", _description, *outcome.failure);
    }
    return outcome;
  } catch (const std::exception& ex) {
    return fail(fmt::format("{}, {}", _description, ex.what()));
  }
}

check check::save_as(std::string name) const {
  auto description = fmt::format("{}.save_as({})", _description, name);
  return check(
      std::move(description),
      [inner = *this, name = std::move(name)](
          const entry_map& result, const session& s) {
        auto outcome = inner(result, s);
        if (outcome.failure.has_value()) {
          return outcome;
        }
        if (!outcome.extracted.has_value()) {
          return fail("found nothing to save");
        }
        outcome.saved.emplace(name, *outcome.extracted);
        return outcome;
      });
}

value_check_builder::value_check_builder(
    std::string description, extractor<value> ex)
  : _description(std::move(description)), _ex(std::move(ex)) {}

check value_check_builder::is(value_expr expected) const {
  return check(
      _description + ".is",
      [ex = _ex, expected = std::move(expected)](
          const entry_map& r, const session& s) {
        auto v = ex(r, s);
        auto exp = expected(s);
        if (!v.has_value() || *v != exp) {
          return fail(fmt::format("found {}, expected {}", found(v), exp));
        }
        return pass(to_slot(std::move(v)));
      });
}

check value_check_builder::is_null() const {
  return check(
      _description + ".is_null",
      [ex = _ex](const entry_map& r, const session& s) {
        auto v = ex(r, s);
        if (!v.has_value() || !v->is_null()) {
          return fail(fmt::format("found {}, expected null", found(v)));
        }
        return pass(to_slot(std::move(v)));
      });
}

check value_check_builder::not_null() const {
  return check(
      _description + ".not_null",
      [ex = _ex](const entry_map& r, const session& s) {
        auto v = ex(r, s);
        if (!v.has_value() || v->is_null()) {
          return fail(fmt::format("found {}, expected not null", found(v)));
        }
        return pass(to_slot(std::move(v)));
      });
}

check value_check_builder::exists() const {
  return check(
      _description + ".exists",
      [ex = _ex](const entry_map& r, const session& s) {
        auto v = ex(r, s);
        if (!v.has_value()) {
          return fail("found nothing");
        }
        return pass(to_slot(std::move(v)));
      });
}

check value_check_builder::not_exists() const {
  return check(
      _description + ".not_exists",
      [ex = _ex](const entry_map& r, const session& s) {
        auto v = ex(r, s);
        if (v.has_value()) {
          return fail(fmt::format("found {}, expected nothing", *v));
        }
        return pass();
      });
}

check value_check_builder::validate(
    std::function<bool(const value&, const session&)> fn) const {
  return check(
      _description + ".validate",
      [ex = _ex, fn = std::move(fn)](const entry_map& r, const session& s) {
        auto v = ex(r, s);
        if (!v.has_value()) {
          return fail("found nothing");
        }
        if (!fn(*v, s)) {
          return fail(fmt::format("validation failed on {}", *v));
        }
        return pass(to_slot(std::move(v)));
      });
}

check value_check_builder::save_as(std::string name) const {
  return exists().save_as(std::move(name));
}

check count_check_builder::is(uint64_t n) const {
  return check(
      fmt::format("entries.count.is({})", n),
      [n](const entry_map& r, const session&) {
        if (r.size() != n) {
          return fail(fmt::format("found {}", r.size()));
        }
        return pass(value(r.size()));
      });
}

check count_check_builder::gt(uint64_t n) const {
  return check(
      fmt::format("entries.count.gt({})", n),
      [n](const entry_map& r, const session&) {
        if (r.size() <= n) {
          return fail(fmt::format("found {}", r.size()));
        }
        return pass(value(r.size()));
      });
}

check count_check_builder::lt(uint64_t n) const {
  return check(
      fmt::format("entries.count.lt({})", n),
      [n](const entry_map& r, const session&) {
        if (r.size() >= n) {
          return fail(fmt::format("found {}", r.size()));
        }
        return pass(value(r.size()));
      });
}

check count_check_builder::save_as(std::string name) const {
  return check("entries.count", [](const entry_map& r, const session&) {
           return pass(value(r.size()));
         })
      .save_as(std::move(name));
}

find_check_builder::find_check_builder(
    std::string description, extractor<entry> ex)
  : _description(std::move(description)), _ex(std::move(ex)) {}

check find_check_builder::exists() const {
  return check(
      _description + ".exists",
      [ex = _ex](const entry_map& r, const session& s) {
        auto e = ex(r, s);
        if (!e.has_value()) {
          return fail("found nothing");
        }
        return pass(to_slot(std::move(e)));
      });
}

check find_check_builder::not_exists() const {
  return check(
      _description + ".not_exists",
      [ex = _ex](const entry_map& r, const session& s) {
        auto e = ex(r, s);
        if (e.has_value()) {
          return fail(fmt::format("found {}, expected nothing", *e));
        }
        return pass();
      });
}

check find_check_builder::is(entry_expr expected) const {
  return check(
      _description + ".is",
      [ex = _ex, expected = std::move(expected)](
          const entry_map& r, const session& s) {
        auto e = ex(r, s);
        auto exp = expected(s);
        if (!e.has_value() || *e != exp) {
          return fail(fmt::format("found {}, expected {}", found(e), exp));
        }
        return pass(to_slot(std::move(e)));
      });
}

check find_check_builder::save_as(std::string name) const {
  return exists().save_as(std::move(name));
}

check find_check_builder::validate(
    std::function<bool(const entry&, const session&)> fn) const {
  return check(
      _description + ".validate",
      [ex = _ex, fn = std::move(fn)](const entry_map& r, const session& s) {
        auto e = ex(r, s);
        if (!e.has_value()) {
          return fail("found nothing");
        }
        if (!fn(*e, s)) {
          return fail(fmt::format("validation failed on {}", *e));
        }
        return pass(to_slot(std::move(e)));
      });
}

value_check_builder find_check_builder::transform(
    std::function<value(const entry&)> fn) const {
  return value_check_builder(
      _description + ".transform",
      [ex = _ex, fn = std::move(fn)](
          const entry_map& r, const session& s) -> std::optional<value> {
        auto e = ex(r, s);
        if (!e.has_value()) {
          return std::nullopt;
        }
        return fn(*e);
      });
}

check find_all_check_builder::is(entries_expr expected) const {
  return check(
      "entries.find_all.is",
      [expected = std::move(expected)](const entry_map& r, const session& s) {
        auto exp = expected(s);
        if (r != exp) {
          return fail(fmt::format(
              "found {}, expected {}", fmt::streamed(r), fmt::streamed(exp)));
        }
        return pass(session::slot{to_entries(r)});
      });
}

check find_all_check_builder::exists() const {
  return check(
      "entries.find_all.exists", [](const entry_map& r, const session&) {
        if (r.empty()) {
          return fail("found nothing");
        }
        return pass(session::slot{to_entries(r)});
      });
}

check find_all_check_builder::save_as(std::string name) const {
  return exists().save_as(std::move(name));
}

find_check_builder entries_check_builder::find() const {
  return find_check_builder(
      "entries.find",
      [](const entry_map& r, const session&) -> std::optional<entry> {
        if (r.empty()) {
          return std::nullopt;
        }
        if (r.size() > 1) {
          throw util::check_error(
              fmt::format("ambiguous result of {} entries", r.size()));
        }
        const auto& [k, v] = *r.begin();
        return entry{.key = k, .val = v};
      });
}

find_check_builder entries_check_builder::find(size_t index) const {
  return find_check_builder(
      fmt::format("entries.find({})", index),
      [index](const entry_map& r, const session&) -> std::optional<entry> {
        if (index >= r.size()) {
          return std::nullopt;
        }
        const auto& [k, v] = *std::next(r.begin(), index);
        return entry{.key = k, .val = v};
      });
}

find_check_builder entries_check_builder::find_key(value_expr key) const {
  return find_check_builder(
      "entries.find_key",
      [key = std::move(key)](
          const entry_map& r, const session& s) -> std::optional<entry> {
        auto k = key(s);
        auto it = r.find(k);
        if (it == r.end()) {
          return std::nullopt;
        }
        return entry{.key = it->first, .val = it->second};
      });
}

value_check_builder map_check_builder::transform(
    std::function<value(const entry_map&)> fn) const {
  return value_check_builder(
      "map_result.transform",
      [fn = std::move(fn)](
          const entry_map& r, const session&) -> std::optional<value> {
        return fn(r);
      });
}

check map_check_builder::validate(
    std::function<bool(const entry_map&, const session&)> fn) const {
  return check(
      "map_result.validate",
      [fn = std::move(fn)](const entry_map& r, const session& s) {
        if (!fn(r, s)) {
          return fail(fmt::format("validation failed on {}", fmt::streamed(r)));
        }
        return pass(session::slot{to_entries(r)});
      });
}

check map_check_builder::save_as(std::string name) const {
  return check("map_result", [](const entry_map& r, const session&) {
           return pass(session::slot{to_entries(r)});
         })
      .save_as(std::move(name));
}

entries_check_builder entries() { return {}; }

map_check_builder map_result() { return {}; }

std::string check_report::message() const {
  return fmt::format("{}", fmt::join(failures, "; "));
}

check_report run_checks(
    const std::vector<check>& checks,
    const entry_map& result,
    session s,
    check_policy policy) {
  check_report report{.s = std::move(s)};
  for (const auto& c : checks) {
    auto outcome = c(result, report.s);
    if (outcome.failure.has_value()) {
      report.failures.emplace_back(std::move(*outcome.failure));
      if (policy == check_policy::strict) {
        break;
      }
      continue;
    }
    if (outcome.saved.has_value()) {
      report.s = report.s.set(
          std::move(outcome.saved->first), std::move(outcome.saved->second));
    }
  }
  return report;
}

}  // namespace kvchain
