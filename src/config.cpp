#include "chronicle/config.hpp"
#include "chronicle/core/platform_utils.hpp"

#include <string>

namespace chronicle {

auto validate(const TimelineConfig& config) -> std::expected<void, core::error> {
    if (config.merge_tolerance_divisor < 1) {
        return core::make_error(core::error_code::config_invalid,
                                "merge_tolerance_divisor must be positive, got " +
                                    std::to_string(config.merge_tolerance_divisor),
                                "config.validate");
    }
    return {};
}

auto config_from_env(TimelineConfig base) -> std::expected<TimelineConfig, core::error> {
    if (auto divisor = core::env_int("CHRONICLE_MERGE_DIVISOR")) {
        if (!divisor->has_value()) {
            return core::make_error(core::error_code::config_invalid,
                                    "CHRONICLE_MERGE_DIVISOR is not an integer",
                                    "config.from_env");
        }
        base.merge_tolerance_divisor = **divisor;
    }
    if (auto v = core::env_flag("CHRONICLE_PROPAGATE_TAG_ERRORS")) base.propagate_tag_errors = *v;
    if (auto v = core::env_flag("CHRONICLE_LOG_QUERIES")) base.log_queries = *v;

    if (auto ok = validate(base); !ok) return std::unexpected(ok.error());
    return base;
}

} // namespace chronicle
