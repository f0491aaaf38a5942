#pragma once

/** \file filter_expr.hpp
 *  \brief Filter expression AST over event attributes.
 *
 * Use cases: compile to a SQL condition (see filter_sql.hpp) for every timeline query.
 * Ownership: this AST is value-semantic and self-contained; a copy never shares
 * children with its source, and nothing in the library mutates a tree it is given.
 *
 * Every node carries a filter_state. A node is active when it is selected and not
 * disabled; inactive nodes place no restriction (type filters excepted, see
 * filter_sql.hpp).
 */

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "chronicle/event.hpp"
#include "chronicle/event_type.hpp"

namespace chronicle {

struct filter_state {
    bool selected{true};
    bool disabled{false};

    [[nodiscard]] auto active() const -> bool { return selected && !disabled; }
};

enum class description_filter_mode : std::uint8_t { include, exclude };

/** \brief Description equality (case-insensitive) at a fixed level of detail. */
struct description_filter {
    std::string description;
    description_lod lod{description_lod::short_form};
    description_filter_mode mode{description_filter_mode::include};
    filter_state state{};
};

/** \brief Substring search across all three descriptions. */
struct text_filter {
    std::string text;
    filter_state state{};
};

struct tag_name_filter {
    tag_name name;
    filter_state state{};
};

/** \brief Events carrying at least one of the selected tag names. */
struct tags_filter {
    std::vector<tag_name_filter> children;
    filter_state state{};
};

struct hash_set_filter {
    std::int64_t hash_set_id{0};
    std::string name;
    filter_state state{};
};

/** \brief Events hit by at least one of the selected hash sets. */
struct hash_hits_filter {
    std::vector<hash_set_filter> children;
    filter_state state{};
};

struct data_source_filter {
    std::int64_t data_source_id{0};
    std::string name;
    filter_state state{};
};

/** \brief Events from any of the active child data sources. */
struct data_sources_filter {
    std::vector<data_source_filter> children;
    filter_state state{};
};

/** \brief When active, drops events whose content is classified as known. */
struct hide_known_filter {
    filter_state state{};
};

/** \brief Type membership, mirroring the type hierarchy below \p type. */
struct type_filter {
    event_type_id type{root_event_type};
    std::vector<type_filter> children;
    filter_state state{};
};

/** \brief Recursive filter expression. */
struct filter_expr {
    struct intersection_t { std::vector<filter_expr> children; filter_state state{}; };
    struct union_t        { std::vector<filter_expr> children; filter_state state{}; };

    std::variant<description_filter, text_filter, tags_filter, hash_hits_filter,
                 data_source_filter, data_sources_filter, hide_known_filter, type_filter,
                 intersection_t, union_t>
        node; /**< root node */
};

/**
 * \brief The top-level filter: an intersection of exactly the recognised kinds,
 * plus any additional description filters or combinators (e.g. hidden descriptions).
 */
struct root_filter {
    hide_known_filter hide_known{};
    tags_filter tags{};
    hash_hits_filter hash_hits{};
    text_filter text{};
    type_filter types{};
    data_sources_filter data_sources{};
    std::vector<filter_expr> extra;
};

[[nodiscard]] auto is_active(const filter_expr& expr) -> bool;

/** \brief The intersection the root stands for, members in fixed order. */
[[nodiscard]] auto to_expr(const root_filter& root) -> filter_expr;

/** \brief Fully selected type filter tree rooted at \p type. */
[[nodiscard]] auto make_type_filter(event_type_id type = root_event_type) -> type_filter;

/**
 * \brief Root filter that admits every event: known files shown, all types,
 * no text, every listed tag name/hash set/data source selected but the tag and
 * hash filters themselves deselected.
 */
[[nodiscard]] auto make_default_root_filter(const std::vector<tag_name>& tag_names = {},
                                            const std::vector<hash_set_filter>& hash_sets = {},
                                            const std::vector<data_source_filter>& data_sources = {})
    -> root_filter;

/** \brief Single-line human-readable rendering, e.g. for diagnostics. */
[[nodiscard]] auto describe(const filter_expr& expr) -> std::string;

} // namespace chronicle
