#pragma once

#include <seastar/util/log.hh>

namespace kvchain {

extern seastar::logger l;

}  // namespace kvchain
