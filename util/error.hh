#pragma once

#include <fmt/format.h>

#include <exception>
#include <string>
#include <string_view>

namespace kvchain::util {

enum class code : uint8_t {
  ok = 0,
  panic,
  configuration,
  serialization,
  invalid_argument,
  no_client,
  async_conflict,
  cache_not_found,
  operation,
  transaction,
  check,
  closed,
  unknown,
  num_of_codes,
};

std::string_view status_string(enum code e);

class base_error : public std::exception {
 public:
  explicit base_error(enum code e) : _e(e), _msg(status_string(e)) {}
  base_error(enum code e, std::string msg) : _e(e), _msg(std::move(msg)) {}
  template <typename... Args>
  base_error(std::string_view s, enum code e, Args&&... args)
    : _e(e)
    , _msg(fmt::format(
          fmt::runtime(s), status_string(e), std::forward<Args>(args)...)) {}

  code error_code() const noexcept { return _e; }

  const char* what() const noexcept override { return _msg.c_str(); }

 protected:
  enum code _e;
  std::string _msg;
};

class panic : public base_error {
 public:
  using base_error::base_error;
  explicit panic(std::string_view msg)
    : base_error(code::panic, std::string(msg)) {}
};

class configuration_error : public base_error {
 public:
  using base_error::base_error;
  configuration_error(std::string_view key, std::string_view msg)
    : base_error("{}: key:{}, reason:{}", code::configuration, key, msg) {}
};

class serialization_error : public base_error {
 public:
  using base_error::base_error;
  serialization_error() : base_error(code::serialization) {}
  explicit serialization_error(std::string_view type)
    : base_error("{}: failed type:{}", code::serialization, type) {}
};

class invalid_argument : public base_error {
 public:
  using base_error::base_error;
  invalid_argument() : base_error(code::invalid_argument) {}
  invalid_argument(std::string_view arg, std::string_view msg)
    : base_error("{}: arg:{}, reason:{}", code::invalid_argument, arg, msg) {}
};

// raised before any operation is attempted, the session stays untouched
class resolution_error : public base_error {
 public:
  using base_error::base_error;
};

class no_client_error : public resolution_error {
 public:
  no_client_error() : resolution_error(code::no_client, "no active client") {}
};

class async_conflict_error : public resolution_error {
 public:
  async_conflict_error()
    : resolution_error(
          code::async_conflict,
          "async API cannot be used in a transaction or with explicit locks") {
  }
};

class cache_not_found_error : public resolution_error {
 public:
  using resolution_error::resolution_error;
  explicit cache_not_found_error(std::string_view cache)
    : resolution_error("{}: cache {} not found", code::cache_not_found, cache) {
  }
};

class operation_error : public base_error {
 public:
  using base_error::base_error;
  explicit operation_error(std::string_view msg)
    : base_error("{}: {}", code::operation, msg) {}
};

class transaction_error : public operation_error {
 public:
  using operation_error::operation_error;
  transaction_error(uint64_t tx_id, std::string_view msg)
    : operation_error("{}: tx:{}, {}", code::transaction, tx_id, msg) {}
};

class check_error : public base_error {
 public:
  using base_error::base_error;
  explicit check_error(std::string_view msg)
    : base_error(code::check, std::string(msg)) {}
};

class closed_error : public base_error {
 public:
  using base_error::base_error;
  closed_error() : base_error(code::closed) {}
  explicit closed_error(std::string_view service)
    : base_error("{}: service {} closed", code::closed, service) {}
};

}  // namespace kvchain::util
