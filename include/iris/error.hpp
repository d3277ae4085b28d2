#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling; the transport layer maps
 *   them to response codes via to_string() without inspecting messages.
 * - Human-readable message and originating component for diagnostics.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace iris::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  io_failed = 1001,
  config_invalid = 2001,
  corrupt_index = 3001,
  invalid_parameter = 4001,
  invalid_image = 4002,
  not_found = 6001,
  network_error = 7001,
  timeout = 7002,
  encoding_failure = 7501,
  cancelled = 8001,
  rebuild_in_progress = 8101,
  rebuild_failed = 8102,
  internal = 9001,
  unsupported = 9005,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "image.acquire" */
};

/** \brief Stable lowercase name of an error code ("invalid_image", ...). */
constexpr auto to_string(error_code ec) noexcept -> std::string_view {
  switch (ec) {
    case error_code::ok: return "ok";
    case error_code::io_failed: return "io_failed";
    case error_code::config_invalid: return "config_invalid";
    case error_code::corrupt_index: return "corrupt_index";
    case error_code::invalid_parameter: return "invalid_parameter";
    case error_code::invalid_image: return "invalid_image";
    case error_code::not_found: return "not_found";
    case error_code::network_error: return "network_error";
    case error_code::timeout: return "timeout";
    case error_code::encoding_failure: return "encoding_failure";
    case error_code::cancelled: return "cancelled";
    case error_code::rebuild_in_progress: return "rebuild_in_progress";
    case error_code::rebuild_failed: return "rebuild_failed";
    case error_code::internal: return "internal";
    case error_code::unsupported: return "unsupported";
  }
  return "internal";
}

/** \brief Transient conditions a caller may retry. */
constexpr auto is_retryable(error_code ec) noexcept -> bool {
  return ec == error_code::network_error || ec == error_code::timeout;
}

/** \brief Shorthand for building an unexpected error value. */
inline auto make_unexpected(error_code code, std::string message, std::string component)
    -> std::unexpected<error> {
  return std::unexpected(error{code, std::move(message), std::move(component)});
}

} // namespace iris::core
