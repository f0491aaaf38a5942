#pragma once

/** \file time_range.hpp
 *  \brief Half-open second-resolution intervals and the calendar units used to bucket them.
 *
 * All calendar arithmetic is UTC.
 */

#include <cstdint>
#include <optional>
#include <string_view>

namespace chronicle {

/** \brief [start, end) in seconds since the Unix epoch. */
struct time_range {
    std::int64_t start{0};
    std::int64_t end{0};

    [[nodiscard]] auto duration() const -> std::int64_t { return end - start; }
    [[nodiscard]] auto contains(std::int64_t t) const -> bool { return t >= start && t < end; }

    /** \brief Same range with end pushed to at least start + 1. */
    [[nodiscard]] auto widened() const -> time_range {
        return time_range{start, end > start ? end : start + 1};
    }

    /** \brief Seconds strictly between this range and \p later; nullopt if they overlap or abut. */
    [[nodiscard]] auto gap_to(const time_range& later) const -> std::optional<time_range> {
        if (later.start > end) return time_range{end, later.start};
        if (start > later.end) return time_range{later.end, start};
        return std::nullopt;
    }

    /** \brief Smallest range covering both. */
    [[nodiscard]] auto span_with(const time_range& other) const -> time_range {
        return time_range{start < other.start ? start : other.start, end > other.end ? end : other.end};
    }

    friend auto operator==(const time_range&, const time_range&) -> bool = default;
};

enum class time_unit : std::uint8_t { years, months, days, hours, minutes, seconds };

auto to_string(time_unit unit) -> std::string_view;

/** \brief Start of the \p unit-sized calendar block containing \p t. */
auto truncate(std::int64_t t, time_unit unit) -> std::int64_t;

/** \brief \p t moved by \p n calendar units (day of month clamped for months and years). */
auto add_units(std::int64_t t, time_unit unit, std::int64_t n) -> std::int64_t;

/** \brief Length in seconds of one \p unit measured from \p from. */
auto period_seconds_from(std::int64_t from, time_unit unit) -> std::int64_t;

/** \brief Whole calendar months from \p from to \p to (0 when to <= from). */
auto whole_months_between(std::int64_t from, std::int64_t to) -> std::int64_t;

/**
 * \brief How a range is divided into display blocks.
 *
 * The unit is the coarsest one of which the range spans more than three whole
 * units, falling back to seconds; it grows monotonically with the span.
 */
struct RangeDivision {
    time_unit period_size{time_unit::seconds};
    time_range aligned{};           /**< range widened outwards to unit boundaries */
    std::int64_t block_count{0};    /**< number of unit blocks in aligned */
};

auto divide_range(const time_range& range) -> RangeDivision;

} // namespace chronicle
