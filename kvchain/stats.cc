#include "stats.hh"

#include <map>

namespace kvchain {

const char* name(enum request_status status) {
  static const char* types[] = {
      "OK",
      "KO",
  };
  static_assert(
      std::size(types) == static_cast<int>(request_status::num_of_status));
  return types[static_cast<uint8_t>(status)];
}

std::ostream& operator<<(std::ostream& os, request_status status) {
  return os << name(status);
}

void stats_recorder::log_response(
    const session& s,
    std::string_view request,
    request_record::clock::time_point start,
    request_record::clock::time_point end,
    request_status status,
    std::optional<std::string> message) {
  _records.push_back(request_record{
      .user_id = s.user_id(),
      .scenario = s.scenario(),
      .groups = s.groups(),
      .request = std::string(request),
      .start = start,
      .end = end,
      .status = status,
      .message = std::move(message),
  });
}

void stats_recorder::log_crash(
    const session& s, std::string_view request, std::string message) {
  auto now = request_record::clock::now();
  _records.push_back(request_record{
      .user_id = s.user_id(),
      .scenario = s.scenario(),
      .groups = s.groups(),
      .request = std::string(request),
      .start = now,
      .end = now,
      .status = request_status::ko,
      .message = std::move(message),
      .crashed = true,
  });
}

size_t stats_recorder::count(
    std::string_view request, request_status status) const {
  return std::count_if(
      _records.begin(), _records.end(), [request, status](const auto& r) {
        return r.request == request && r.status == status;
      });
}

size_t stats_recorder::failed_requests() const {
  return std::count_if(_records.begin(), _records.end(), [](const auto& r) {
    return r.status == request_status::ko;
  });
}

const request_record* stats_recorder::find(std::string_view request) const {
  for (const auto& r : _records) {
    if (r.request == request) {
      return &r;
    }
  }
  return nullptr;
}

std::ostream& operator<<(std::ostream& os, const stats_recorder& r) {
  struct summary {
    size_t ok = 0;
    size_t ko = 0;
    request_record::clock::duration total{};
  };
  std::map<std::string, summary> requests;
  for (const auto& record : r._records) {
    auto& s = requests[record.request];
    if (record.status == request_status::ok) {
      s.ok++;
    } else {
      s.ko++;
    }
    s.total += record.latency();
  }
  for (const auto& [request, s] : requests) {
    auto mean = std::chrono::duration_cast<std::chrono::microseconds>(
        s.total / std::max<size_t>(s.ok + s.ko, 1));
    os << request << ": ok=" << s.ok << ", ko=" << s.ko
       << ", mean=" << mean.count() << "us\n";
  }
  return os;
}

}  // namespace kvchain
