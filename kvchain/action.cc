#include "action.hh"

#include <seastar/core/coroutine.hh>

#include "kvchain/logger.hh"
#include "util/error.hh"

namespace kvchain {

using request_clock = request_record::clock;

action_result action_result::proceed(session s) {
  return action_result{.s = std::move(s)};
}

action_result action_result::fail(session s, std::string reason) {
  return action_result{.s = s.mark_as_failed(), .failure = std::move(reason)};
}

action::action(std::string type, std::string resource, std::string request_name)
  : _type(std::move(type)), _resource(std::move(resource)) {
  if (!request_name.empty()) {
    _request_name = std::move(request_name);
  } else if (_resource.empty()) {
    _request_name = _type;
  } else {
    _request_name = fmt::format("{} {}", _type, _resource);
  }
}

future<action_result> action::execute(scenario_context& ctx, session s) {
  l.trace("{}: executing with {}", _request_name, s);
  std::optional<std::string> crashed;
  auto incoming = s;
  try {
    co_return co_await do_execute(ctx, std::move(s));
  } catch (const std::exception& ex) {
    crashed = failure_message(ex.what());
  }
  l.warn("{}: crashed, {}", _request_name, *crashed);
  ctx.stats.log_crash(incoming, _request_name, *crashed);
  co_return action_result::fail(std::move(incoming), std::move(*crashed));
}

future<action_result> action::report(
    scenario_context& ctx,
    session s,
    session_op op,
    std::optional<session> on_failure) {
  std::optional<std::string> error;
  std::optional<session> outgoing;
  auto start = request_clock::now();
  try {
    outgoing = co_await op();
  } catch (const std::exception& ex) {
    error = failure_message(ex.what());
  }
  auto end = request_clock::now();
  if (error.has_value()) {
    l.warn("{}: failed, {}", _request_name, *error);
    ctx.stats.log_response(
        s, _request_name, start, end, request_status::ko, error);
    co_return action_result::fail(
        on_failure.has_value() ? std::move(*on_failure) : std::move(s),
        std::move(*error));
  }
  l.trace("{}: succeeded", _request_name);
  ctx.stats.log_response(
      s, _request_name, start, end, request_status::ok, std::nullopt);
  co_return action_result::proceed(std::move(*outgoing));
}

future<action_result> action::report(
    scenario_context& ctx,
    session s,
    const std::vector<check>& checks,
    cache_op op) {
  auto policy = ctx.cfg.check;
  auto incoming = s;
  return report(
      ctx,
      std::move(s),
      [&checks, policy, incoming, op = std::move(op)]() mutable {
        return op().then([&checks, policy, incoming = std::move(incoming)](
                             protocol::entry_map result) mutable {
          auto r = run_checks(checks, result, std::move(incoming), policy);
          if (!r.ok()) {
            throw util::check_error(r.message());
          }
          return std::move(r.s);
        });
      });
}

action_result action::reject(
    scenario_context& ctx, session s, std::string reason) {
  auto message = failure_message(reason);
  l.warn("{}: rejected, {}", _request_name, message);
  auto now = request_clock::now();
  ctx.stats.log_response(
      s, _request_name, now, now, request_status::ko, message);
  return action_result::fail(std::move(s), std::move(message));
}

action_result action::acknowledge(scenario_context& ctx, session s) {
  l.trace("{}: nothing to do", _request_name);
  auto now = request_clock::now();
  ctx.stats.log_response(
      s, _request_name, now, now, request_status::ok, std::nullopt);
  return action_result::proceed(std::move(s));
}

std::string action::failure_message(std::string_view reason) const {
  if (_resource.empty()) {
    return fmt::format("{}: {}", _type, reason);
  }
  return fmt::format("{} {}: {}", _type, _resource, reason);
}

}  // namespace kvchain
