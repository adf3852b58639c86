#include "logger.hh"

namespace kvchain {

seastar::logger l{"kvchain"};

}  // namespace kvchain
