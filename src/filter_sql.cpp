#include "chronicle/filter_sql.hpp"

#include <algorithm>
#include <cctype>
#include <type_traits>
#include <vector>

namespace chronicle::filter_sql {

namespace {

template <class> inline constexpr bool always_false_v = false;

auto lowered_without_space(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isspace(uc)) continue;
        out.push_back(static_cast<char>(std::tolower(uc)));
    }
    return out;
}

// True when s[0] is '(' and its matching ')' is the last character.
auto wrapped_whole(std::string_view s) -> bool {
    if (s.size() < 2 || s.front() != '(' || s.back() != ')') return false;
    int depth = 0;
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '(') ++depth;
        else if (s[i] == ')') --depth;
        if (depth == 0 && i + 1 < s.size()) return false;
    }
    return depth == 0;
}

auto peel(std::string_view s) -> std::string_view {
    while (wrapped_whole(s)) s = s.substr(1, s.size() - 2);
    return s;
}

auto join_ids(const auto& ids) -> std::string {
    std::string out;
    bool first = true;
    for (const auto& id : ids) {
        if (!first) out += ", ";
        first = false;
        out += std::to_string(id);
    }
    return out;
}

auto description_column(description_lod lod) -> std::string_view {
    switch (lod) {
        case description_lod::full: return "full_description";
        case description_lod::medium: return "med_description";
        case description_lod::short_form: return "short_description";
    }
    return "full_description";
}

auto strip(std::string_view text) -> std::string_view {
    const auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!text.empty() && is_space(text.front())) text.remove_prefix(1);
    while (!text.empty() && is_space(text.back())) text.remove_suffix(1);
    return text;
}

void collect_type_ids(const type_filter& f, std::set<event_type_id>& out) {
    if (!f.state.active()) return;
    if (!f.children.empty()) {
        for (const auto& child : f.children) collect_type_ids(child, out);
        return;
    }
    const auto* t = find_event_type(f.type);
    if (t == nullptr) return;
    if (t->level == type_level::sub) {
        out.insert(f.type);
        return;
    }
    // A childless base or root node stands for every sub-type below it.
    for (auto child : child_types(f.type)) {
        const auto* ct = find_event_type(child);
        if (ct->level == type_level::sub) {
            out.insert(child);
        } else {
            for (auto grandchild : child_types(child)) out.insert(grandchild);
        }
    }
}

class Compiler {
public:
    explicit Compiler(const store::Dialect& dialect)
        : d_(dialect), true_(dialect.true_literal()), false_(dialect.false_literal()) {}

    auto compile_node(const filter_expr& e) const -> compiled_condition {
        compiled_condition out = std::visit([this](const auto& node) -> compiled_condition {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, description_filter>) {
                return {description_sql(node), {}};
            } else if constexpr (std::is_same_v<T, text_filter>) {
                return {text_sql(node), {}};
            } else if constexpr (std::is_same_v<T, tags_filter>) {
                return tags_sql(node);
            } else if constexpr (std::is_same_v<T, hash_hits_filter>) {
                return hash_hits_sql(node);
            } else if constexpr (std::is_same_v<T, data_source_filter>) {
                if (!node.state.active()) return {true_, {}};
                return {"(datasource_id = " + std::to_string(node.data_source_id) + ")", {}};
            } else if constexpr (std::is_same_v<T, data_sources_filter>) {
                return {data_sources_sql(node), {}};
            } else if constexpr (std::is_same_v<T, hide_known_filter>) {
                if (!node.state.active()) return {true_, {}};
                const auto known = std::to_string(static_cast<std::int32_t>(known_state::known));
                return {"(" + d_.not_equal_null_safe("known_state", known) + ")", {}};
            } else if constexpr (std::is_same_v<T, type_filter>) {
                return {type_sql(node), {}};
            } else if constexpr (std::is_same_v<T, filter_expr::intersection_t>) {
                return intersection_sql(node);
            } else if constexpr (std::is_same_v<T, filter_expr::union_t>) {
                return union_sql(node);
            } else {
                static_assert(always_false_v<T>, "compile: unhandled filter kind");
            }
        }, e.node);
        out.sql = normalize(out.sql, d_);
        if (out.sql == true_) out.joins = {};
        return out;
    }

private:
    auto description_sql(const description_filter& f) const -> std::string {
        if (!f.state.active() || strip(f.description).empty()) return true_;
        const bool negate = f.mode == description_filter_mode::exclude;
        return "(" + d_.like(description_column(f.lod), store::Dialect::escape_like(f.description), negate) + ")";
    }

    auto text_sql(const text_filter& f) const -> std::string {
        if (!f.state.active()) return true_;
        const auto text = strip(f.text);
        if (text.empty()) return true_;
        const auto pattern = "%" + store::Dialect::escape_like(text) + "%";
        return "((" + d_.like("med_description", pattern, false) + ") OR (" +
               d_.like("full_description", pattern, false) + ") OR (" +
               d_.like("short_description", pattern, false) + "))";
    }

    auto tags_sql(const tags_filter& f) const -> compiled_condition {
        if (!f.state.active()) return {true_, {}};
        std::vector<std::int64_t> ids;
        for (const auto& child : f.children) {
            if (child.state.active()) ids.push_back(child.name.id);
        }
        if (ids.empty()) return {true_, {}};
        return {"((tags.tag_name_id IN (" + join_ids(ids) + ")) AND (tags.event_id = events.event_id))",
                {.tags = true, .hash_set_hits = false}};
    }

    auto hash_hits_sql(const hash_hits_filter& f) const -> compiled_condition {
        if (!f.state.active()) return {true_, {}};
        std::vector<std::int64_t> ids;
        for (const auto& child : f.children) {
            if (child.state.active()) ids.push_back(child.hash_set_id);
        }
        if (ids.empty()) return {true_, {}};
        return {"((hash_set_hits.hash_set_id IN (" + join_ids(ids) +
                    ")) AND (hash_set_hits.event_id = events.event_id))",
                {.tags = false, .hash_set_hits = true}};
    }

    auto data_sources_sql(const data_sources_filter& f) const -> std::string {
        if (!f.state.active() || f.children.empty()) return true_;
        std::vector<std::int64_t> ids;
        for (const auto& child : f.children) {
            if (child.state.active()) ids.push_back(child.data_source_id);
        }
        if (ids.empty()) return false_;
        return "(datasource_id IN (" + join_ids(ids) + "))";
    }

    auto type_sql(const type_filter& f) const -> std::string {
        if (!f.state.active()) return false_;
        if (f.type == root_event_type && fully_selected(f)) return true_;
        const auto ids = selected_type_ids(f);
        if (ids.empty()) return false_;
        return "(sub_type IN (" + join_ids(ids) + "))";
    }

    auto intersection_sql(const filter_expr::intersection_t& node) const -> compiled_condition {
        if (!node.state.active()) return {true_, {}};
        compiled_condition out{};
        std::vector<std::string> parts;
        for (const auto& child : node.children) {
            if (!is_active(child)) continue;
            auto c = compile_node(child);
            if (c.sql == true_) continue;
            if (c.sql == false_) return {false_, {}};
            out.joins.merge(c.joins);
            parts.push_back(std::move(c.sql));
        }
        out.sql = combine(parts, " AND ");
        return out;
    }

    auto union_sql(const filter_expr::union_t& node) const -> compiled_condition {
        if (!node.state.active()) return {true_, {}};
        compiled_condition out{};
        std::vector<std::string> parts;
        bool any_child = false;
        for (const auto& child : node.children) {
            if (!is_active(child)) continue;
            any_child = true;
            auto c = compile_node(child);
            if (c.sql == true_) return {true_, {}};
            if (c.sql == false_) continue;
            out.joins.merge(c.joins);
            parts.push_back(std::move(c.sql));
        }
        if (!any_child) return {true_, {}};
        if (parts.empty()) return {false_, {}};
        out.sql = combine(parts, " OR ");
        return out;
    }

    auto combine(const std::vector<std::string>& parts, std::string_view op) const -> std::string {
        if (parts.empty()) return true_;
        if (parts.size() == 1) return parts.front();
        std::string out = "(";
        for (std::size_t i = 0; i < parts.size(); ++i) {
            if (i) out += op;
            out += parts[i];
        }
        out += ")";
        return out;
    }

    const store::Dialect& d_;
    std::string true_;
    std::string false_;
};

} // namespace

auto compile(const filter_expr& expr, const store::Dialect& dialect) -> compiled_condition {
    return Compiler(dialect).compile_node(expr);
}

auto compile(const root_filter& root, const store::Dialect& dialect) -> compiled_condition {
    return compile(to_expr(root), dialect);
}

auto normalize(std::string_view condition, const store::Dialect& dialect) -> std::string {
    const auto literal = lowered_without_space(dialect.true_literal());
    const auto squeezed = lowered_without_space(condition);
    const auto body = peel(squeezed);
    if (body.empty()) return std::string(dialect.true_literal());

    bool all_true = true;
    std::size_t pos = 0;
    while (pos <= body.size()) {
        const auto next = body.find("and", pos);
        const auto part = peel(body.substr(pos, next == std::string_view::npos ? std::string_view::npos : next - pos));
        if (part != literal) {
            all_true = false;
            break;
        }
        if (next == std::string_view::npos) break;
        pos = next + 3;
    }
    if (all_true) return std::string(dialect.true_literal());
    return std::string(condition);
}

auto is_trivially_true(std::string_view condition, const store::Dialect& dialect) -> bool {
    return normalize(condition, dialect) == dialect.true_literal();
}

auto join_clause(const join_requirements& joins) -> std::string {
    std::string out;
    if (joins.hash_set_hits) out += " LEFT JOIN hash_set_hits ON hash_set_hits.event_id = events.event_id";
    if (joins.tags) out += " LEFT JOIN tags ON tags.event_id = events.event_id";
    return out;
}

auto selected_type_ids(const type_filter& filter) -> std::set<event_type_id> {
    std::set<event_type_id> ids;
    collect_type_ids(filter, ids);
    return ids;
}

auto fully_selected(const type_filter& filter) -> bool {
    if (!filter.state.active()) return false;
    return std::all_of(filter.children.begin(), filter.children.end(),
                       [](const type_filter& child) { return fully_selected(child); });
}

} // namespace chronicle::filter_sql
