#pragma once

/** \file filter_sql.hpp
 *  \brief Lowering of filter_expr trees to SQL conditions over the events table.
 *
 * Rules:
 * - Inactive nodes place no restriction (true literal); intersections and unions
 *   only consider their active children and drop trivially-true parts.
 * - A type filter that is itself deselected excludes its branch (false literal); a
 *   root type filter whose whole hierarchy is active collapses to true.
 * - Tag and hash-set leaves correlate events with a secondary table and report that
 *   the corresponding LEFT JOIN is required through join_requirements.
 *
 * compile() is pure and total; every filter kind is handled at compile time.
 */

#include <set>
#include <string>
#include <string_view>

#include "chronicle/filter_expr.hpp"
#include "chronicle/store/dialect.hpp"

namespace chronicle::filter_sql {

/** \brief Auxiliary joins a condition depends on. */
struct join_requirements {
    bool tags{false};
    bool hash_set_hits{false};

    [[nodiscard]] auto any() const -> bool { return tags || hash_set_hits; }
    void merge(const join_requirements& other) {
        tags = tags || other.tags;
        hash_set_hits = hash_set_hits || other.hash_set_hits;
    }
    friend auto operator==(const join_requirements&, const join_requirements&) -> bool = default;
};

struct compiled_condition {
    std::string sql;
    join_requirements joins{};
};

[[nodiscard]] auto compile(const filter_expr& expr, const store::Dialect& dialect) -> compiled_condition;
[[nodiscard]] auto compile(const root_filter& root, const store::Dialect& dialect) -> compiled_condition;

/**
 * \brief Collapse conditions that are structurally "true": after removing whitespace,
 * an empty group or a parenthesised conjunction of true literals becomes the true literal.
 */
[[nodiscard]] auto normalize(std::string_view condition, const store::Dialect& dialect) -> std::string;

[[nodiscard]] auto is_trivially_true(std::string_view condition, const store::Dialect& dialect) -> bool;

/** \brief " LEFT JOIN ..." text for \p joins, empty when none are required. */
[[nodiscard]] auto join_clause(const join_requirements& joins) -> std::string;

/** \brief Sub-type ids admitted by the active branches of \p filter. */
[[nodiscard]] auto selected_type_ids(const type_filter& filter) -> std::set<event_type_id>;

/** \brief Whether \p filter and every node below it is active. */
[[nodiscard]] auto fully_selected(const type_filter& filter) -> bool;

} // namespace chronicle::filter_sql
