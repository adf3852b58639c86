#pragma once

#include <chrono>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "kvchain/session.hh"

namespace kvchain {

enum class request_status : uint8_t {
  ok,
  ko,
  num_of_status,
};

const char* name(enum request_status status);
std::ostream& operator<<(std::ostream& os, request_status status);

struct request_record {
  using clock = std::chrono::steady_clock;

  uint64_t user_id = 0;
  std::string scenario;
  std::vector<std::string> groups;
  std::string request;
  clock::time_point start;
  clock::time_point end;
  request_status status = request_status::ok;
  std::optional<std::string> message;
  // a crashed request failed before reaching the cluster
  bool crashed = false;

  clock::duration latency() const noexcept { return end - start; }
};

/// \class stats_engine
///
/// \brief the sink of per-request outcomes, provided by the load harness.
class stats_engine {
 public:
  virtual ~stats_engine() = default;

  virtual void log_response(
      const session& s,
      std::string_view request,
      request_record::clock::time_point start,
      request_record::clock::time_point end,
      request_status status,
      std::optional<std::string> message) = 0;

  virtual void log_crash(
      const session& s, std::string_view request, std::string message) = 0;
};

/// \class stats_recorder
///
/// \brief keeps every record in memory, used by the demo and the tests.
class stats_recorder final : public stats_engine {
 public:
  void log_response(
      const session& s,
      std::string_view request,
      request_record::clock::time_point start,
      request_record::clock::time_point end,
      request_status status,
      std::optional<std::string> message) override;

  void log_crash(
      const session& s, std::string_view request, std::string message) override;

  const std::vector<request_record>& records() const noexcept {
    return _records;
  }
  size_t count(std::string_view request, request_status status) const;
  size_t failed_requests() const;
  const request_record* find(std::string_view request) const;
  void clear() { _records.clear(); }

  friend std::ostream& operator<<(std::ostream& os, const stats_recorder& r);

 private:
  std::vector<request_record> _records;
};

}  // namespace kvchain

template <>
struct fmt::formatter<kvchain::request_status> : fmt::ostream_formatter {};
template <>
struct fmt::formatter<kvchain::stats_recorder> : fmt::ostream_formatter {};
