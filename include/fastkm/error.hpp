#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable numeric codes for programmatic handling; values never change once published.
 * - Human-readable message and originating component for diagnostics.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace fastkm::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  config_invalid = 2001,
  precondition_failed = 4001,
  insufficient_distinct_points = 4002,
  empty_dataset = 4003,
  inconsistent_dimension = 4004,
  internal = 9001,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "fast_kmeans" */
};

constexpr std::string_view to_string(error_code ec) noexcept {
  switch (ec) {
    case error_code::config_invalid: return "config_invalid";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::insufficient_distinct_points: return "insufficient_distinct_points";
    case error_code::empty_dataset: return "empty_dataset";
    case error_code::inconsistent_dimension: return "inconsistent_dimension";
    case error_code::internal: return "internal";
  }
  return "internal";
}

} // namespace fastkm::core
