#include "chronicle/error.hpp"

namespace chronicle::core {

auto to_string(error_code code) -> const char* {
  switch (code) {
    case error_code::ok: return "ok";
    case error_code::store_failed: return "store_failed";
    case error_code::schema_failed: return "schema_failed";
    case error_code::config_invalid: return "config_invalid";
    case error_code::data_integrity: return "data_integrity";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::not_found: return "not_found";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
    case error_code::unsupported: return "unsupported";
  }
  return "internal";
}

} // namespace chronicle::core
