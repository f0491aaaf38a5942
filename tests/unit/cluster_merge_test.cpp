#include <catch2/catch_all.hpp>
#include <chronicle/cluster/cluster_merge.hpp>

#include <algorithm>
#include <initializer_list>
#include <random>

using namespace chronicle;
using namespace chronicle::cluster;

namespace {

EventCluster make(std::int64_t start, std::int64_t end, std::initializer_list<std::uint64_t> members,
                  std::string description = "report.docx", event_type_id type = event_types::file_modified) {
    id_set ids;
    for (auto m : members) ids.add(m);
    return EventCluster(time_range{start, end}, type, std::move(description), description_lod::full,
                        std::move(ids), id_set{}, id_set{});
}

constexpr std::int64_t kHour = 3600;

} // namespace

TEST_CASE("clusters within a quarter period merge", "[cluster][merge]") {
    // Hour blocks tolerate a 900 second gap with the default divisor.
    std::vector<EventCluster> in{make(0, kHour, {1}), make(kHour + 900, 2 * kHour, {2})};
    auto out = merge_clusters(in, time_unit::hours, 4);
    REQUIRE(out.has_value());
    REQUIRE(out->size() == 1);
    REQUIRE(out->front().span() == time_range{0, 2 * kHour});
    REQUIRE(out->front().size() == 2);

    std::vector<EventCluster> apart{make(0, kHour, {1}), make(kHour + 901, 2 * kHour, {2})};
    out = merge_clusters(apart, time_unit::hours, 4);
    REQUIRE(out.has_value());
    REQUIRE(out->size() == 2);
}

TEST_CASE("divisor controls the tolerance", "[cluster][merge]") {
    std::vector<EventCluster> in{make(0, kHour, {1}), make(kHour + 1800, 3 * kHour, {2})};
    REQUIRE(merge_clusters(in, time_unit::hours, 2)->size() == 1);
    REQUIRE(merge_clusters(in, time_unit::hours, 4)->size() == 2);
    REQUIRE(merge_clusters(in, time_unit::hours, 1)->size() == 1);

    auto bad = merge_clusters(in, time_unit::hours, 0);
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code == core::error_code::invalid_argument);
}

TEST_CASE("overlapping and abutting clusters always merge", "[cluster][merge]") {
    std::vector<EventCluster> in{make(0, 10, {1}), make(10, 20, {2}), make(15, 40, {3})};
    auto out = merge_clusters(in, time_unit::seconds, 4);
    REQUIRE(out.has_value());
    REQUIRE(out->size() == 1);
    REQUIRE(out->front().span() == time_range{0, 40});
}

TEST_CASE("clusters of different keys never merge", "[cluster][merge]") {
    std::vector<EventCluster> in{make(0, 10, {1}, "a.txt"), make(0, 10, {2}, "b.txt"),
                                make(0, 10, {3}, "a.txt", event_types::file_created)};
    auto out = merge_clusters(in, time_unit::seconds, 4);
    REQUIRE(out.has_value());
    REQUIRE(out->size() == 3);
    REQUIRE((*out)[0].description() == "a.txt");
    REQUIRE((*out)[0].type() == event_types::file_modified);
    REQUIRE((*out)[1].description() == "b.txt");
    REQUIRE((*out)[2].type() == event_types::file_created);
}

TEST_CASE("merge output ignores input order and is idempotent", "[cluster][merge]") {
    std::vector<EventCluster> in;
    for (std::int64_t i = 0; i < 40; ++i) {
        const auto start = (i % 10) * 2 * kHour + (i / 10) * 60;
        in.push_back(make(start, start + kHour, {static_cast<std::uint64_t>(i + 1)},
                          i % 2 ? "odd.txt" : "even.txt"));
    }
    auto reference = merge_clusters(in, time_unit::hours, 4);
    REQUIRE(reference.has_value());

    std::mt19937 rng(7);
    for (int round = 0; round < 5; ++round) {
        std::shuffle(in.begin(), in.end(), rng);
        auto shuffled = merge_clusters(in, time_unit::hours, 4);
        REQUIRE(shuffled.has_value());
        REQUIRE(*shuffled == *reference);
    }

    auto again = merge_clusters(*reference, time_unit::hours, 4);
    REQUIRE(again.has_value());
    REQUIRE(*again == *reference);
}

TEST_CASE("stripes group every cluster of a key", "[cluster][stripe]") {
    std::vector<EventCluster> in{make(500, 600, {4}, "b.txt"), make(0, 10, {1}, "a.txt"),
                                 make(900, 910, {2}, "a.txt")};
    auto stripes = to_stripes(in);
    REQUIRE(stripes.has_value());
    REQUIRE(stripes->size() == 2);
    REQUIRE((*stripes)[0].description() == "a.txt");
    REQUIRE((*stripes)[0].clusters().size() == 2);
    REQUIRE((*stripes)[0].span() == time_range{0, 910});
    REQUIRE((*stripes)[1].description() == "b.txt");

    auto none = to_stripes({});
    REQUIRE(none.has_value());
    REQUIRE(none->empty());
}

TEST_CASE("group-concat payload parsing", "[cluster][parse]") {
    REQUIRE(parse_id_list("")->empty());
    REQUIRE(*parse_id_list("7") == std::vector<std::int64_t>{7});
    REQUIRE(*parse_id_list("3,1,2") == std::vector<std::int64_t>{3, 1, 2});

    for (const char* bad : {"1,,2", "1,", ",1", "1,x", "1, 2", "12a"}) {
        auto r = parse_id_list(bad);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == core::error_code::data_integrity);
    }

    auto set = parse_id_set("5,3,5");
    REQUIRE(set.has_value());
    REQUIRE(to_vector(*set) == std::vector<std::int64_t>{3, 5});
    auto negative = parse_id_set("1,-2");
    REQUIRE_FALSE(negative.has_value());
    REQUIRE(negative.error().code == core::error_code::data_integrity);
}
