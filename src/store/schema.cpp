#include "chronicle/store/schema.hpp"

#include <array>
#include <set>
#include <string>
#include <vector>

namespace chronicle::store::schema {

namespace {

constexpr const char* kComponent = "store.schema";

struct index_def {
    std::string_view table;
    std::string_view columns;
};

constexpr std::array<index_def, 9> kEventIndices{{
    {"events", "datasource_id"},
    {"events", "event_id, hash_hit"},
    {"events", "event_id, tagged"},
    {"events", "file_id"},
    {"events", "artifact_id"},
    {"events", "sub_type, short_description, time"},
    {"events", "base_type, short_description, time"},
    {"events", "time"},
    {"events", "known_state"},
}};

auto index_name(const index_def& def) -> std::string {
    std::string name(def.table);
    name += '_';
    for (char c : def.columns) {
        if (c == ' ') continue;
        name += (c == ',') ? '_' : c;
    }
    name += "_idx";
    return name;
}

auto guarded(HostStore& store, std::string_view step, const std::string& sql) -> std::expected<void, core::error> {
    if (auto r = store.execute(sql); !r) {
        return core::make_error(core::error_code::schema_failed, std::string(step), kComponent,
                                r.error().cause.empty() ? r.error().message : r.error().cause);
    }
    return {};
}

auto column_names(const HostStore& store, std::string_view table) -> std::expected<std::set<std::string>, core::error> {
    std::set<std::string> names;
    auto r = store.query(store.dialect().column_listing_query(table), {}, [&](const Row& row) -> std::expected<void, core::error> {
        const auto col = row.find_column("name");
        if (!col) {
            return core::make_error(core::error_code::data_integrity, "column listing has no name column", kComponent);
        }
        names.insert(row.get_text(*col));
        return {};
    });
    if (!r) return core::rewrap(r.error(), "list columns of " + std::string(table), kComponent);
    return names;
}

} // namespace

auto initialize(HostStore& store) -> std::expected<void, core::error> {
    const auto& d = store.dialect();
    const std::string pk = std::string(d.primary_key_type());

    if (auto r = guarded(store, "create db_info table",
                         "CREATE TABLE IF NOT EXISTS db_info (key TEXT, value INTEGER, PRIMARY KEY (key))");
        !r) {
        return r;
    }
    if (auto r = guarded(store, "create events table",
                         "CREATE TABLE IF NOT EXISTS events (event_id " + pk + " PRIMARY KEY, "
                         "datasource_id BIGINT, file_id BIGINT, artifact_id BIGINT, time INTEGER, "
                         "sub_type INTEGER, base_type INTEGER, full_description TEXT, med_description TEXT, "
                         "short_description TEXT, known_state INTEGER, hash_hit INTEGER, tagged INTEGER)");
        !r) {
        return r;
    }
    if (auto r = upgrade_columns(store); !r) return r;

    if (auto r = guarded(store, "create hash_sets table",
                         "CREATE TABLE IF NOT EXISTS hash_sets (hash_set_id " + pk + " PRIMARY KEY, "
                         "hash_set_name VARCHAR(255) UNIQUE NOT NULL)");
        !r) {
        return r;
    }
    if (auto r = guarded(store, "create hash_set_hits table",
                         "CREATE TABLE IF NOT EXISTS hash_set_hits (hash_set_id INTEGER REFERENCES hash_sets(hash_set_id) NOT NULL, "
                         "event_id INTEGER REFERENCES events(event_id) NOT NULL, PRIMARY KEY (hash_set_id, event_id))");
        !r) {
        return r;
    }
    if (auto r = guarded(store, "create tags table",
                         "CREATE TABLE IF NOT EXISTS tags (tag_id INTEGER NOT NULL, tag_name_id INTEGER NOT NULL, "
                         "tag_name_display_name TEXT NOT NULL, event_id INTEGER REFERENCES events(event_id) NOT NULL, "
                         "PRIMARY KEY (event_id, tag_name_id))");
        !r) {
        return r;
    }
    for (const auto& def : kEventIndices) {
        const auto name = index_name(def);
        if (auto r = guarded(store, "create index " + name,
                             "CREATE INDEX IF NOT EXISTS " + name + " ON " + std::string(def.table) + "(" +
                                 std::string(def.columns) + ")");
            !r) {
            return r;
        }
    }
    return {};
}

auto upgrade_columns(HostStore& store) -> std::expected<void, core::error> {
    auto existing = column_names(store, events_table);
    if (!existing) return std::unexpected(existing.error());

    struct added_column { std::string_view name; std::string_view type; };
    constexpr std::array<added_column, 3> kAdded{{
        {"datasource_id", "INTEGER"},
        {"tagged", "INTEGER"},
        {"hash_hit", "INTEGER"},
    }};
    for (const auto& col : kAdded) {
        if (existing->contains(std::string(col.name))) continue;
        if (auto r = guarded(store, "add column " + std::string(col.name),
                             "ALTER TABLE events ADD COLUMN " + std::string(col.name) + " " + std::string(col.type));
            !r) {
            return r;
        }
    }
    return {};
}

auto has_upgrade_columns(const HostStore& store) -> std::expected<bool, core::error> {
    auto existing = column_names(store, events_table);
    if (!existing) return std::unexpected(existing.error());
    return existing->contains("datasource_id") && existing->contains("tagged") && existing->contains("hash_hit");
}

auto drop_all(HostStore& store) -> std::expected<void, core::error> {
    // Dependents first.
    for (std::string_view table : {tags_table, hash_set_hits_table, hash_sets_table, events_table, db_info_table}) {
        if (auto r = guarded(store, "drop " + std::string(table), "DROP TABLE IF EXISTS " + std::string(table)); !r) {
            return r;
        }
    }
    return {};
}

auto reset_tags(HostStore& store) -> std::expected<void, core::error> {
    if (auto r = guarded(store, "drop tags", "DROP TABLE IF EXISTS tags"); !r) return r;
    return initialize(store);
}

} // namespace chronicle::store::schema
