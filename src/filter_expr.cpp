#include "chronicle/filter_expr.hpp"

#include <type_traits>

namespace chronicle {

namespace {

template <class> inline constexpr bool always_false_v = false;

void describe_type(const type_filter& f, std::string& out) {
    const auto* t = find_event_type(f.type);
    out += t ? std::string(t->name) : "type#" + std::to_string(f.type);
    if (!f.state.active()) out += "(off)";
    if (f.children.empty()) return;
    out += "[";
    for (std::size_t i = 0; i < f.children.size(); ++i) {
        if (i) out += ",";
        describe_type(f.children[i], out);
    }
    out += "]";
}

void describe_impl(const filter_expr& e, std::string& out) {
    std::visit([&out](const auto& node) {
        using T = std::decay_t<decltype(node)>;
        if (!node.state.active()) out += "~";
        if constexpr (std::is_same_v<T, description_filter>) {
            out += node.mode == description_filter_mode::include ? "description" : "not-description";
            out += "(" + std::string(to_string(node.lod)) + "='" + node.description + "')";
        } else if constexpr (std::is_same_v<T, text_filter>) {
            out += "text('" + node.text + "')";
        } else if constexpr (std::is_same_v<T, tags_filter>) {
            out += "tags(";
            for (std::size_t i = 0; i < node.children.size(); ++i) {
                if (i) out += ",";
                if (!node.children[i].state.active()) out += "~";
                out += node.children[i].name.display_name;
            }
            out += ")";
        } else if constexpr (std::is_same_v<T, hash_hits_filter>) {
            out += "hash-sets(";
            for (std::size_t i = 0; i < node.children.size(); ++i) {
                if (i) out += ",";
                if (!node.children[i].state.active()) out += "~";
                out += node.children[i].name;
            }
            out += ")";
        } else if constexpr (std::is_same_v<T, data_source_filter>) {
            out += "data-source(" + std::to_string(node.data_source_id) + ")";
        } else if constexpr (std::is_same_v<T, data_sources_filter>) {
            out += "data-sources(";
            for (std::size_t i = 0; i < node.children.size(); ++i) {
                if (i) out += ",";
                if (!node.children[i].state.active()) out += "~";
                out += std::to_string(node.children[i].data_source_id);
            }
            out += ")";
        } else if constexpr (std::is_same_v<T, hide_known_filter>) {
            out += "hide-known";
        } else if constexpr (std::is_same_v<T, type_filter>) {
            out += "types(";
            describe_type(node, out);
            out += ")";
        } else if constexpr (std::is_same_v<T, filter_expr::intersection_t> ||
                             std::is_same_v<T, filter_expr::union_t>) {
            out += std::is_same_v<T, filter_expr::intersection_t> ? "and(" : "or(";
            for (std::size_t i = 0; i < node.children.size(); ++i) {
                if (i) out += ",";
                describe_impl(node.children[i], out);
            }
            out += ")";
        } else {
            static_assert(always_false_v<T>, "describe: unhandled filter kind");
        }
    }, e.node);
}

} // namespace

auto is_active(const filter_expr& expr) -> bool {
    return std::visit([](const auto& node) { return node.state.active(); }, expr.node);
}

auto to_expr(const root_filter& root) -> filter_expr {
    filter_expr::intersection_t all{};
    all.children.reserve(6 + root.extra.size());
    all.children.push_back(filter_expr{root.hide_known});
    all.children.push_back(filter_expr{root.tags});
    all.children.push_back(filter_expr{root.hash_hits});
    all.children.push_back(filter_expr{root.text});
    all.children.push_back(filter_expr{root.types});
    all.children.push_back(filter_expr{root.data_sources});
    for (const auto& e : root.extra) all.children.push_back(e);
    return filter_expr{std::move(all)};
}

auto make_type_filter(event_type_id type) -> type_filter {
    type_filter f{};
    f.type = type;
    for (event_type_id child : child_types(type)) {
        f.children.push_back(make_type_filter(child));
    }
    return f;
}

auto make_default_root_filter(const std::vector<tag_name>& tag_names,
                              const std::vector<hash_set_filter>& hash_sets,
                              const std::vector<data_source_filter>& data_sources) -> root_filter {
    root_filter root{};
    root.hide_known.state.selected = false;

    root.tags.state.selected = false;
    for (const auto& name : tag_names) root.tags.children.push_back(tag_name_filter{name, {}});

    root.hash_hits.state.selected = false;
    root.hash_hits.children = hash_sets;

    root.types = make_type_filter(root_event_type);
    root.data_sources.children = data_sources;
    return root;
}

auto describe(const filter_expr& expr) -> std::string {
    std::string out;
    describe_impl(expr, out);
    return out;
}

} // namespace chronicle
