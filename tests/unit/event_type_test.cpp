#include <catch2/catch_test_macros.hpp>

#include <chronicle/event_type.hpp>
#include <chronicle/filter_expr.hpp>

using namespace chronicle;

TEST_CASE("type ids are the pre-order index of the hierarchy", "[types]") {
    const auto types = all_event_types();
    REQUIRE(types.size() == 21);
    for (std::size_t i = 0; i < types.size(); ++i) {
        REQUIRE(types[i].id == static_cast<event_type_id>(i));
    }
    REQUIRE(find_event_type(event_types::web_history)->name == "WEB_HISTORY");
    REQUIRE(find_event_type(event_types::devices_attached)->parent == event_types::misc_types);
}

TEST_CASE("root and unknown ids", "[types]") {
    const auto* root = find_event_type(root_event_type);
    REQUIRE(root != nullptr);
    REQUIRE(root->level == type_level::root);
    REQUIRE(find_event_type(21) == nullptr);
    REQUIRE(find_event_type(-7) == nullptr);
    REQUIRE_FALSE(is_known_type(99));
}

TEST_CASE("children and base ordinals", "[types]") {
    REQUIRE(child_types(root_event_type) ==
            std::vector<event_type_id>{event_types::file_system, event_types::web_activity, event_types::misc_types});
    REQUIRE(child_types(event_types::file_system) ==
            std::vector<event_type_id>{1, 2, 3, 4});
    REQUIRE(child_types(event_types::exif).empty());

    REQUIRE(base_ordinal(event_types::file_accessed) == 0);
    REQUIRE(base_ordinal(event_types::web_activity) == 1);
    REQUIRE(base_ordinal(event_types::gps_route) == 2);
    REQUIRE_FALSE(base_ordinal(root_event_type).has_value());

    REQUIRE(base_type_for_ordinal(2) == event_types::misc_types);
    REQUIRE_FALSE(base_type_for_ordinal(3).has_value());
}

TEST_CASE("type at zoom level", "[types]") {
    REQUIRE(type_at_zoom(event_types::web_cookie, type_zoom_level::base_type) == event_types::web_activity);
    REQUIRE(type_at_zoom(event_types::web_cookie, type_zoom_level::sub_type) == event_types::web_cookie);
    REQUIRE(type_at_zoom(event_types::web_activity, type_zoom_level::base_type) == event_types::web_activity);
}

TEST_CASE("default type filter mirrors the hierarchy", "[types][filter]") {
    const auto f = make_type_filter();
    REQUIRE(f.type == root_event_type);
    REQUIRE(f.children.size() == 3);
    REQUIRE(f.children[1].type == event_types::web_activity);
    REQUIRE(f.children[1].children.size() == 5);
    REQUIRE(f.children[2].children.back().type == event_types::devices_attached);
    REQUIRE(f.state.active());
}
