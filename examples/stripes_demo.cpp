/**
 * Timeline stripes example using Chronicle
 *
 * This example demonstrates:
 * - Opening a SQLite-backed timeline
 * - Inserting events with hash-set hits and tags
 * - Zooming out to stripes and narrowing with a filter
 *
 * Usage: chronicle_stripes_demo [database-path]   (defaults to an in-memory store)
 */

#include <chronicle/config.hpp>
#include <chronicle/store/sqlite_store.hpp>
#include <chronicle/timeline_manager.hpp>

#include <cstdint>
#include <iostream>
#include <string>

namespace {

void print_error(const char* what, const chronicle::core::error& e) {
    std::cerr << what << " failed: " << chronicle::core::to_string(e.code) << " [" << e.component << "] "
              << e.message;
    if (!e.cause.empty()) std::cerr << " (" << e.cause << ")";
    std::cerr << "\n";
}

void print_stripes(const std::vector<chronicle::cluster::EventStripe>& stripes) {
    for (const auto& s : stripes) {
        const auto* type = chronicle::find_event_type(s.type());
        std::cout << "  " << (type ? type->display_name : "?") << " | " << s.description() << " | ["
                  << s.span().start << ", " << s.span().end << ") | " << s.size() << " events in "
                  << s.clusters().size() << " cluster(s), " << s.event_ids_with_hash_hits().cardinality()
                  << " hash hit(s), " << s.event_ids_with_tags().cardinality() << " tagged\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    using namespace chronicle;

    const std::string path = argc > 1 ? argv[1] : ":memory:";

    auto config = config_from_env();
    if (!config) {
        print_error("config", config.error());
        return 1;
    }

    auto db = store::SqliteStore::open(path);
    if (!db) {
        print_error("open store", db.error());
        return 1;
    }

    auto timeline = TimelineManager::open(**db, *config);
    if (!timeline) {
        print_error("open timeline", timeline.error());
        return 1;
    }

    // One browsing session and one document edited throughout a day.
    constexpr std::int64_t day = 1615766400;  // 2021-03-15T00:00:00Z
    std::int64_t file_id = 1;
    for (std::int64_t minute = 0; minute < 24 * 60; minute += 37) {
        EventInsert ev;
        ev.time = day + minute * 60;
        ev.type = event_types::file_modified;
        ev.data_source_id = 1;
        ev.file_id = file_id;
        ev.full_description = "C:/Users/alice/Documents/report.docx";
        ev.med_description = "C:/Users/alice/Documents";
        ev.short_description = "report.docx";
        if (minute % 5 == 0) ev.hash_set_names.insert("Known Bad");
        if (auto r = timeline->insert_event(ev); !r) {
            print_error("insert", r.error());
            return 1;
        }
    }
    for (std::int64_t minute = 600; minute < 660; minute += 3) {
        EventInsert ev;
        ev.time = day + minute * 60;
        ev.type = minute % 2 ? event_types::web_history : event_types::web_search;
        ev.data_source_id = 1;
        ev.file_id = 2;
        ev.artifact_id = 1000 + minute;
        ev.full_description = "https://www.example.com/search?q=timeline";
        ev.med_description = "https://www.example.com/search";
        ev.short_description = "www.example.com";
        if (auto r = timeline->insert_event(ev); !r) {
            print_error("insert", r.error());
            return 1;
        }
    }
    if (auto r = timeline->add_tag(file_id, std::nullopt, Tag{1, tag_name{1, "Notable Item"}}); !r) {
        print_error("tag", r.error());
        return 1;
    }

    ZoomParams zoom{
        .range = {day, day + 24 * 60 * 60},
        .filter = make_default_root_filter(),
        .type_zoom = type_zoom_level::base_type,
        .lod = description_lod::short_form,
    };
    const auto division = divide_range(zoom.range);
    std::cout << "Range divided into " << division.block_count << " " << to_string(division.period_size)
              << " blocks\n";

    auto stripes = timeline->get_event_stripes(zoom);
    if (!stripes) {
        print_error("stripes", stripes.error());
        return 1;
    }
    std::cout << "Base types, short descriptions:\n";
    print_stripes(*stripes);

    zoom.type_zoom = type_zoom_level::sub_type;
    zoom.filter.text.text = "example";
    std::cout << "Where: " << timeline->sql_where(zoom.filter) << "\n";
    stripes = timeline->get_event_stripes(zoom);
    if (!stripes) {
        print_error("stripes", stripes.error());
        return 1;
    }
    std::cout << "Sub types matching 'example':\n";
    print_stripes(*stripes);

    auto counts = timeline->count_events_by_type(zoom);
    if (!counts) {
        print_error("count", counts.error());
        return 1;
    }
    for (const auto& [type, count] : *counts) {
        std::cout << "  " << find_event_type(type)->display_name << ": " << count << "\n";
    }
    return 0;
}
