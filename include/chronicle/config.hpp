#pragma once

/** \file config.hpp
 *  \brief Tunables of the timeline engine and their environment overrides.
 */

#include <cstdint>
#include <expected>

#include "chronicle/error.hpp"

namespace chronicle {

struct TimelineConfig {
    /** Clusters of one key merge when their gap is at most period / divisor. */
    std::int64_t merge_tolerance_divisor{4};
    /** When false, a failed add_tag is logged and reported as "no events tagged". */
    bool propagate_tag_errors{false};
    /** Emit every generated statement to the diagnostic sink at debug level. */
    bool log_queries{false};
};

auto validate(const TimelineConfig& config) -> std::expected<void, core::error>;

/**
 * \brief Overlay environment variables on \p base.
 *
 * CHRONICLE_MERGE_DIVISOR (positive integer), CHRONICLE_PROPAGATE_TAG_ERRORS and
 * CHRONICLE_LOG_QUERIES (flags). Unset variables leave the base value alone.
 */
auto config_from_env(TimelineConfig base = {}) -> std::expected<TimelineConfig, core::error>;

} // namespace chronicle
