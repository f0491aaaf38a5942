#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling.
 * - Human-readable message, originating component and the backend cause for diagnostics.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <utility>

namespace chronicle::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  store_failed = 1001,
  schema_failed = 1002,
  config_invalid = 2001,
  data_integrity = 3001,
  precondition_failed = 4001,
  not_found = 6001,
  internal = 9001,
  invalid_argument = 9002,
  unsupported = 9005,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< attempted operation, human-readable */
  std::string component;                   /**< subsystem, e.g., "timeline.get_event_ids" */
  std::string cause;                       /**< underlying backend text, empty if none */
};

inline auto make_error(error_code code, std::string message, std::string component,
                       std::string cause = {}) -> std::unexpected<error> {
  return std::unexpected(error{code, std::move(message), std::move(component), std::move(cause)});
}

/** \brief Re-wrap a store failure with the operation that was being attempted. */
inline auto rewrap(error e, std::string message, std::string component) -> std::unexpected<error> {
  if (e.cause.empty()) e.cause = e.message;
  e.message = std::move(message);
  e.component = std::move(component);
  return std::unexpected(std::move(e));
}

auto to_string(error_code code) -> const char*;

} // namespace chronicle::core
