#include <catch2/catch_all.hpp>
#include <chronicle/filter_sql.hpp>
#include <chronicle/store/dialect.hpp>

using namespace chronicle;
using filter_sql::compile;

namespace {

const store::SqliteDialect sqlite{};
const store::PostgresDialect postgres{};

filter_expr inactive(filter_expr e) {
    std::visit([](auto& node) { node.state.selected = false; }, e.node);
    return e;
}

} // namespace

TEST_CASE("default root filter compiles to the true literal", "[filter]") {
    const auto c = compile(make_default_root_filter(), sqlite);
    REQUIRE(c.sql == "1");
    REQUIRE_FALSE(c.joins.any());
}

TEST_CASE("intersection of only inactive leaves is neutral", "[filter]") {
    filter_expr::intersection_t all{};
    all.children.push_back(inactive(filter_expr{hide_known_filter{}}));
    all.children.push_back(inactive(filter_expr{text_filter{"secret", {}}}));
    all.children.push_back(inactive(filter_expr{data_source_filter{4, "image.dd", {}}}));
    all.children.push_back(inactive(filter_expr{type_filter{event_types::exif, {}, {}}}));
    REQUIRE(compile(filter_expr{all}, sqlite).sql == "1");
    REQUIRE(compile(filter_expr{filter_expr::intersection_t{}}, sqlite).sql == "1");
    REQUIRE(compile(filter_expr{filter_expr::union_t{}}, sqlite).sql == "1");
}

TEST_CASE("type filter collapse and sub-type lists", "[filter][types]") {
    auto types = make_type_filter();
    REQUIRE(compile(filter_expr{types}, sqlite).sql == "1");

    types.children[0].children[1].state.selected = false;  // file accessed
    REQUIRE(compile(filter_expr{types}, sqlite).sql ==
            "(sub_type IN (1, 3, 4, 6, 7, 8, 9, 10, 12, 13, 14, 15, 16, 17, 18, 19, 20))");

    auto web_only = make_type_filter();
    web_only.children[0].state.selected = false;
    web_only.children[2].state.disabled = true;
    REQUIRE(compile(filter_expr{web_only}, sqlite).sql == "(sub_type IN (6, 7, 8, 9, 10))");

    type_filter childless_base{event_types::web_activity, {}, {}};
    REQUIRE(compile(filter_expr{childless_base}, sqlite).sql == "(sub_type IN (6, 7, 8, 9, 10))");

    auto none = make_type_filter();
    for (auto& base : none.children) base.state.selected = false;
    REQUIRE(compile(filter_expr{none}, sqlite).sql == "0");

    auto off = make_type_filter();
    off.state.selected = false;
    REQUIRE(compile(filter_expr{off}, sqlite).sql == "0");
}

TEST_CASE("selected type ids skip inactive branches", "[filter][types]") {
    auto types = make_type_filter();
    types.children[1].state.selected = false;
    types.children[2].children[0].state.selected = false;  // message
    const auto ids = filter_sql::selected_type_ids(types);
    REQUIRE(ids.size() == 4 + 8);
    REQUIRE(ids.count(event_types::web_cookie) == 0);
    REQUIRE(ids.count(event_types::message) == 0);
    REQUIRE(ids.count(event_types::gps_route) == 1);
    REQUIRE_FALSE(filter_sql::fully_selected(types));
    REQUIRE(filter_sql::fully_selected(make_type_filter()));
}

TEST_CASE("text filter searches all descriptions", "[filter]") {
    REQUIRE(compile(filter_expr{text_filter{"  report ", {}}}, sqlite).sql ==
            R"(((med_description LIKE '%report%' ESCAPE '\') OR (full_description LIKE '%report%' ESCAPE '\') OR (short_description LIKE '%report%' ESCAPE '\')))");
    REQUIRE(compile(filter_expr{text_filter{"   ", {}}}, sqlite).sql == "1");
    REQUIRE(compile(filter_expr{text_filter{"", {}}}, sqlite).sql == "1");

    const auto escaped = compile(filter_expr{text_filter{"O'Brien 50%", {}}}, sqlite).sql;
    REQUIRE(escaped.find(R"('%O''Brien 50\%%')") != std::string::npos);
}

TEST_CASE("description filter at its own level of detail", "[filter]") {
    description_filter hide{"Foo_bar", description_lod::short_form, description_filter_mode::exclude, {}};
    REQUIRE(compile(filter_expr{hide}, sqlite).sql == R"((short_description NOT LIKE 'Foo\_bar' ESCAPE '\'))");
    description_filter keep{"www.example.com", description_lod::medium, description_filter_mode::include, {}};
    REQUIRE(compile(filter_expr{keep}, sqlite).sql == R"((med_description LIKE 'www.example.com' ESCAPE '\'))");
    keep.state.disabled = true;
    REQUIRE(compile(filter_expr{keep}, sqlite).sql == "1");
}

TEST_CASE("tag and hash filters require joins", "[filter]") {
    tags_filter tags{};
    tags.children.push_back(tag_name_filter{tag_name{1, "Bookmark"}, {}});
    tags.children.push_back(tag_name_filter{tag_name{2, "Follow up"}, filter_state{false, false}});
    tags.children.push_back(tag_name_filter{tag_name{3, "Notable"}, {}});
    auto c = compile(filter_expr{tags}, sqlite);
    REQUIRE(c.sql == "((tags.tag_name_id IN (1, 3)) AND (tags.event_id = events.event_id))");
    REQUIRE(c.joins.tags);
    REQUIRE_FALSE(c.joins.hash_set_hits);

    hash_hits_filter hits{};
    hits.children.push_back(hash_set_filter{7, "NSRL", {}});
    c = compile(filter_expr{hits}, sqlite);
    REQUIRE(c.sql == "((hash_set_hits.hash_set_id IN (7)) AND (hash_set_hits.event_id = events.event_id))");
    REQUIRE(c.joins.hash_set_hits);
    REQUIRE_FALSE(c.joins.tags);

    hits.children[0].state.selected = false;
    c = compile(filter_expr{hits}, sqlite);
    REQUIRE(c.sql == "1");
    REQUIRE_FALSE(c.joins.any());

    tags.state.selected = false;
    REQUIRE_FALSE(compile(filter_expr{tags}, sqlite).joins.any());
}

TEST_CASE("known and data source leaves", "[filter]") {
    REQUIRE(compile(filter_expr{hide_known_filter{}}, sqlite).sql == "(known_state IS NOT 1)");
    REQUIRE(compile(filter_expr{hide_known_filter{}}, postgres).sql == "(known_state IS DISTINCT FROM 1)");
    REQUIRE(compile(filter_expr{data_source_filter{7, "image.e01", {}}}, sqlite).sql == "(datasource_id = 7)");

    data_sources_filter sources{};
    REQUIRE(compile(filter_expr{sources}, sqlite).sql == "1");
    sources.children.push_back(data_source_filter{1, "a", {}});
    sources.children.push_back(data_source_filter{2, "b", filter_state{true, true}});
    sources.children.push_back(data_source_filter{3, "c", {}});
    REQUIRE(compile(filter_expr{sources}, sqlite).sql == "(datasource_id IN (1, 3))");
    for (auto& s : sources.children) s.state.selected = false;
    REQUIRE(compile(filter_expr{sources}, sqlite).sql == "0");
}

TEST_CASE("root intersection keeps only restricting members", "[filter]") {
    auto root = make_default_root_filter();
    root.hide_known.state.selected = true;
    root.data_sources.children = {data_source_filter{1, "a", {}}, data_source_filter{2, "b", {}}};
    REQUIRE(compile(root, sqlite).sql == "((known_state IS NOT 1) AND (datasource_id IN (1, 2)))");

    root.tags.state.selected = true;
    root.tags.children = {tag_name_filter{tag_name{5, "Evidence"}, {}}};
    const auto c = compile(root, sqlite);
    REQUIRE(c.joins.tags);
    REQUIRE(c.sql.find("tags.tag_name_id IN (5)") != std::string::npos);

    root.data_sources.children[0].state.selected = false;
    root.data_sources.children[1].state.selected = false;
    const auto nothing = compile(root, sqlite);
    REQUIRE(nothing.sql == "0");
    REQUIRE_FALSE(nothing.joins.any());
}

TEST_CASE("union absorbs to true and drops joins of unused parts", "[filter]") {
    filter_expr::union_t either{};
    either.children.push_back(filter_expr{hide_known_filter{}});
    either.children.push_back(filter_expr{data_source_filter{3, "c", {}}});
    REQUIRE(compile(filter_expr{either}, sqlite).sql == "((known_state IS NOT 1) OR (datasource_id = 3))");

    tags_filter tags{};
    tags.children.push_back(tag_name_filter{tag_name{1, "Bookmark"}, {}});
    filter_expr::union_t absorbed{};
    absorbed.children.push_back(filter_expr{tags});
    absorbed.children.push_back(filter_expr{text_filter{"", {}}});
    const auto c = compile(filter_expr{absorbed}, sqlite);
    REQUIRE(c.sql == "1");
    REQUIRE_FALSE(c.joins.any());

    filter_expr::union_t only_inactive{};
    only_inactive.children.push_back(inactive(filter_expr{hide_known_filter{}}));
    REQUIRE(compile(filter_expr{only_inactive}, sqlite).sql == "1");

    auto off = either;
    off.state.selected = false;
    REQUIRE(compile(filter_expr{off}, sqlite).sql == "1");
}

TEST_CASE("normalize collapses all-true conjunctions", "[filter]") {
    using filter_sql::normalize;
    REQUIRE(normalize("( 1 and 1 and 1 )", sqlite) == "1");
    REQUIRE(normalize("()", sqlite) == "1");
    REQUIRE(normalize("(1 AND (1))", sqlite) == "1");
    REQUIRE(normalize("(1 and x)", sqlite) == "(1 and x)");
    REQUIRE(normalize("(TRUE and true)", postgres) == "TRUE");
    REQUIRE(normalize("(short_description LIKE '%band%')", sqlite) == "(short_description LIKE '%band%')");
    REQUIRE(filter_sql::is_trivially_true(" ( 1 ) ", sqlite));
    REQUIRE_FALSE(filter_sql::is_trivially_true("0", sqlite));
}

TEST_CASE("join clauses", "[filter]") {
    REQUIRE(filter_sql::join_clause({}).empty());
    REQUIRE(filter_sql::join_clause({.tags = true, .hash_set_hits = false}) ==
            " LEFT JOIN tags ON tags.event_id = events.event_id");
    REQUIRE(filter_sql::join_clause({.tags = true, .hash_set_hits = true}) ==
            " LEFT JOIN hash_set_hits ON hash_set_hits.event_id = events.event_id"
            " LEFT JOIN tags ON tags.event_id = events.event_id");
}

TEST_CASE("postgres literals", "[filter]") {
    REQUIRE(compile(make_default_root_filter(), postgres).sql == "TRUE");
    auto none = make_type_filter();
    none.state.selected = false;
    REQUIRE(compile(filter_expr{none}, postgres).sql == "FALSE");
}
