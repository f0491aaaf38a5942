/** \file timeline_manager.cpp
 *  \brief TimelineManager implementation: query composition and store access.
 */

#include "chronicle/timeline_manager.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

#include "chronicle/cluster/cluster_merge.hpp"
#include "chronicle/filter_sql.hpp"
#include "chronicle/store/schema.hpp"

namespace chronicle {

namespace {

using core::error;
using core::error_code;
using store::Row;
using store::sql_value;

constexpr const char* kSeparator = ",";

auto join_ids(const auto& ids) -> std::string {
    std::string out;
    bool first = true;
    for (const auto id : ids) {
        if (!first) out += ",";
        first = false;
        out += std::to_string(id);
    }
    return out;
}

auto description_column(description_lod lod) -> const char* {
    switch (lod) {
        case description_lod::full: return "full_description";
        case description_lod::medium: return "med_description";
        case description_lod::short_form: return "short_description";
    }
    return "full_description";
}

auto type_column(type_zoom_level zoom) -> const char* {
    return zoom == type_zoom_level::sub_type ? "sub_type" : "base_type";
}

/** Types that can appear in the sub_type column. */
auto is_stored_type(std::int64_t id) -> bool {
    return id >= 0 && is_known_type(static_cast<event_type_id>(id));
}

auto integrity_error(std::string message, std::string component) -> std::unexpected<error> {
    return core::make_error(error_code::data_integrity, std::move(message), std::move(component));
}

/** Stored type value at \p zoom back to a type id. */
auto decode_type(std::int64_t stored, type_zoom_level zoom) -> std::optional<event_type_id> {
    if (zoom == type_zoom_level::base_type) return base_type_for_ordinal(static_cast<std::int32_t>(stored));
    if (!is_stored_type(stored)) return std::nullopt;
    return static_cast<event_type_id>(stored);
}

auto decode_known(std::int64_t stored) -> std::optional<known_state> {
    switch (stored) {
        case 0: return known_state::unknown;
        case 1: return known_state::known;
        case 2: return known_state::bad;
        default: return std::nullopt;
    }
}

auto text_or_empty(const Row& row, int column) -> std::string {
    return row.is_null(column) ? std::string{} : row.get_text(column);
}

auto collect_ids(std::vector<std::int64_t>& out) -> store::row_handler {
    return [&out](const Row& row) -> std::expected<void, error> {
        out.push_back(row.get_int64(0));
        return {};
    };
}

} // namespace

class TimelineManager::Impl {
public:
    Impl(store::HostStore& store, TimelineConfig config, diag::DiagnosticSink& sink)
        : store_(store), config_(config), sink_(sink) {}

    auto config() const -> const TimelineConfig& { return config_; }

    // --- schema ---

    auto initialize_schema() -> std::expected<void, error> {
        auto lock = store_.write_lock();
        return in_transaction("timeline.initialize_schema", [this] { return store::schema::initialize(store_); });
    }

    auto reinitialize() -> std::expected<void, error> {
        auto lock = store_.write_lock();
        return in_transaction("timeline.reinitialize", [this]() -> std::expected<void, error> {
            if (auto r = store::schema::drop_all(store_); !r) return r;
            return store::schema::initialize(store_);
        });
    }

    auto reinitialize_tags() -> std::expected<void, error> {
        auto lock = store_.write_lock();
        return in_transaction("timeline.reinitialize_tags", [this] { return store::schema::reset_tags(store_); });
    }

    auto analyze() -> std::expected<void, error> {
        auto lock = store_.write_lock();
        for (const auto& sql : store_.dialect().analyze_statements()) {
            log_query("analyze", sql);
            if (auto r = store_.execute(sql); !r) {
                return core::rewrap(r.error(), "analyze events database", "timeline.analyze");
            }
        }
        return {};
    }

    auto has_new_columns() const -> std::expected<bool, error> {
        auto lock = store_.read_lock();
        auto columns = store::schema::has_upgrade_columns(store_);
        if (!columns) return std::unexpected(columns.error());
        if (!*columns) return false;
        auto sources = data_source_ids_locked();
        if (!sources) return std::unexpected(sources.error());
        return !sources->empty();
    }

    // --- writes ---

    auto insert_event(const EventInsert& ev) -> std::expected<std::int64_t, error> {
        constexpr const char* component = "timeline.insert_event";
        const auto* type = find_event_type(ev.type);
        if (type == nullptr || type->level == type_level::root) {
            return core::make_error(error_code::invalid_argument, "unknown event type " + std::to_string(ev.type),
                                    component);
        }
        if (ev.full_description.empty()) {
            return core::make_error(error_code::invalid_argument, "full description must not be empty", component);
        }
        const auto base = base_ordinal(ev.type);

        auto lock = store_.write_lock();
        auto tx = store::Transaction::begin(store_);
        if (!tx) return core::rewrap(tx.error(), "begin insert transaction", component);

        const std::string insert_row =
            "INSERT INTO events (datasource_id, file_id, artifact_id, time, sub_type, base_type, "
            "full_description, med_description, short_description, known_state, hash_hit, tagged) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";
        log_query("insert_event", insert_row);
        auto event_id = store_.insert(insert_row, {
            ev.data_source_id, ev.file_id, store::null_or(ev.artifact_id), ev.time,
            static_cast<std::int64_t>(ev.type), static_cast<std::int64_t>(*base),
            ev.full_description, ev.med_description, ev.short_description,
            static_cast<std::int64_t>(ev.known),
            std::int64_t{ev.hash_set_names.empty() ? 0 : 1},
            std::int64_t{ev.tags.empty() ? 0 : 1},
        });
        if (!event_id) return core::rewrap(event_id.error(), "insert event row", component);

        for (const auto& name : ev.hash_set_names) {
            if (auto r = insert_hash_hit_locked(*event_id, name); !r) return std::unexpected(r.error());
        }
        for (const auto& tag : ev.tags) {
            if (auto r = insert_tag_locked(tag, *event_id); !r) return std::unexpected(r.error());
        }
        if (auto r = tx->commit(); !r) return core::rewrap(r.error(), "commit event insert", component);
        return *event_id;
    }

    auto add_tag(std::int64_t file_id, std::optional<std::int64_t> artifact_id, const Tag& tag)
        -> std::expected<std::set<std::int64_t>, error> {
        auto lock = store_.write_lock();
        auto tagged = add_tag_locked(file_id, artifact_id, tag);
        if (tagged) return tagged;
        if (config_.propagate_tag_errors) return tagged;
        std::ostringstream oss;
        oss << "failed to add tag " << tag.id << " to events of file " << file_id << ": " << tagged.error().message;
        if (!tagged.error().cause.empty()) oss << " (" << tagged.error().cause << ")";
        sink_.emit(diag::severity::severe, "timeline.add_tag", oss.str());
        return std::set<std::int64_t>{};
    }

    auto delete_tag(std::int64_t file_id, std::optional<std::int64_t> artifact_id, std::int64_t tag_id,
                    bool still_tagged) -> std::expected<std::set<std::int64_t>, error> {
        constexpr const char* component = "timeline.delete_tag";
        auto lock = store_.write_lock();
        auto tx = store::Transaction::begin(store_);
        if (!tx) return core::rewrap(tx.error(), "begin tag delete transaction", component);

        const std::string sql = "DELETE FROM tags WHERE tag_id = ?";
        log_query("delete_tag", sql);
        if (auto r = store_.execute(sql, {tag_id}); !r) {
            return core::rewrap(r.error(), "delete tag " + std::to_string(tag_id), component);
        }
        auto ids = mark_events_tagged_locked(file_id, artifact_id, still_tagged);
        if (!ids) return std::unexpected(ids.error());
        if (auto r = tx->commit(); !r) return core::rewrap(r.error(), "commit tag delete", component);
        return ids;
    }

    // --- queries ---

    auto get_event_by_id(std::int64_t event_id) const -> std::expected<std::optional<Event>, error> {
        constexpr const char* component = "timeline.get_event_by_id";
        const std::string sql =
            "SELECT event_id, datasource_id, file_id, artifact_id, time, sub_type, full_description, "
            "med_description, short_description, known_state, hash_hit, tagged FROM events WHERE event_id = ?";
        std::optional<Event> found;
        auto lock = store_.read_lock();
        log_query("get_event_by_id", sql);
        auto r = store_.query(sql, {event_id}, [&found](const Row& row) -> std::expected<void, error> {
            auto ev = event_from_row(row);
            if (!ev) return std::unexpected(ev.error());
            found = std::move(*ev);
            return {};
        });
        if (!r) return core::rewrap(r.error(), "query event " + std::to_string(event_id), component);
        return found;
    }

    auto get_event_ids(const time_range& range, const root_filter& filter) const
        -> std::expected<std::vector<std::int64_t>, error> {
        const auto r = range.widened();
        const auto where = filter_sql::compile(filter, store_.dialect());
        const std::string sql = "SELECT DISTINCT events.event_id, time FROM events" +
                                filter_sql::join_clause(where.joins) + " WHERE time >= ? AND time < ? AND " +
                                where.sql + " ORDER BY time ASC, events.event_id ASC";
        std::vector<std::int64_t> ids;
        auto lock = store_.read_lock();
        log_query("get_event_ids", sql);
        if (auto q = store_.query(sql, {r.start, r.end}, collect_ids(ids)); !q) {
            return core::rewrap(q.error(), "query event ids in range", "timeline.get_event_ids");
        }
        return ids;
    }

    auto count_events_by_type(const ZoomParams& zoom) const
        -> std::expected<std::map<event_type_id, std::int64_t>, error> {
        constexpr const char* component = "timeline.count_events_by_type";
        const auto r = zoom.range.widened();
        const auto where = filter_sql::compile(zoom.filter, store_.dialect());
        const std::string column = type_column(zoom.type_zoom);
        const std::string sql = "SELECT count(DISTINCT events.event_id) AS count, " + column + " FROM events" +
                                filter_sql::join_clause(where.joins) + " WHERE time >= ? AND time < ? AND " +
                                where.sql + " GROUP BY " + column;
        std::map<event_type_id, std::int64_t> counts;
        auto lock = store_.read_lock();
        log_query("count_events_by_type", sql);
        auto q = store_.query(sql, {r.start, r.end}, [&](const Row& row) -> std::expected<void, error> {
            if (row.is_null(1)) return integrity_error("event with null " + column, component);
            const auto type = decode_type(row.get_int64(1), zoom.type_zoom);
            if (!type) return integrity_error("unknown stored " + column + " " + row.get_text(1), component);
            counts[*type] += row.get_int64(0);
            return {};
        });
        if (!q) return core::rewrap(q.error(), "count events by type", component);
        return counts;
    }

    auto get_combined_events(const time_range& range, const root_filter& filter) const
        -> std::expected<std::vector<CombinedEvent>, error> {
        constexpr const char* component = "timeline.get_combined_events";
        const auto r = range.widened();
        const auto& d = store_.dialect();
        const auto where = filter_sql::compile(filter, d);
        const std::string sql = "SELECT full_description, time, file_id, " +
                                d.group_concat("events.event_id", kSeparator) + " AS event_ids, " +
                                d.group_concat("sub_type", kSeparator) + " AS event_types FROM events" +
                                filter_sql::join_clause(where.joins) + " WHERE time >= ? AND time < ? AND " +
                                where.sql +
                                " GROUP BY time, full_description, file_id ORDER BY time ASC, full_description";
        std::vector<CombinedEvent> combined;
        auto lock = store_.read_lock();
        log_query("get_combined_events", sql);
        auto q = store_.query(sql, {r.start, r.end}, [&](const Row& row) -> std::expected<void, error> {
            auto ids = cluster::parse_id_list(text_or_empty(row, 3));
            if (!ids) return std::unexpected(ids.error());
            auto types = cluster::parse_id_list(text_or_empty(row, 4));
            if (!types) return std::unexpected(types.error());
            if (ids->size() != types->size()) {
                return integrity_error("event id and type lists differ in length", component);
            }
            CombinedEvent ev;
            ev.description = text_or_empty(row, 0);
            ev.time = row.get_int64(1);
            ev.file_id = row.get_int64(2);
            for (std::size_t i = 0; i < ids->size(); ++i) {
                if (!is_stored_type((*types)[i])) {
                    return integrity_error("unknown stored sub_type " + std::to_string((*types)[i]), component);
                }
                const auto type = static_cast<event_type_id>((*types)[i]);
                auto [it, inserted] = ev.events_by_type.emplace(type, (*ids)[i]);
                if (!inserted) it->second = std::min(it->second, (*ids)[i]);
            }
            combined.push_back(std::move(ev));
            return {};
        });
        if (!q) return core::rewrap(q.error(), "query combined events", component);
        return combined;
    }

    auto get_bounding_events_interval(const time_range& range, const root_filter& filter) const
        -> std::expected<std::optional<time_range>, error> {
        constexpr const char* component = "timeline.get_bounding_events_interval";
        const auto where = filter_sql::compile(filter, store_.dialect());
        const auto joins = filter_sql::join_clause(where.joins);
        const std::string sql = "SELECT (SELECT max(time) FROM events" + joins + " WHERE time <= ? AND " +
                                where.sql + ") AS start_time, (SELECT min(time) FROM events" + joins +
                                " WHERE time >= ? AND " + where.sql + ") AS end_time";
        std::optional<std::int64_t> start;
        std::optional<std::int64_t> end;
        auto lock = store_.read_lock();
        log_query("get_bounding_events_interval", sql);
        auto q = store_.query(sql, {range.start, range.end}, [&](const Row& row) -> std::expected<void, error> {
            start = row.get_optional_int64(0);
            end = row.get_optional_int64(1);
            return {};
        });
        if (!q) return core::rewrap(q.error(), "query bounding interval", component);
        if (!end) {
            auto max_time = scalar_time_locked("max", component);
            if (!max_time) return std::unexpected(max_time.error());
            if (!*max_time) return std::optional<time_range>{};
            end = **max_time;
        }
        const std::int64_t lower = start.value_or(range.start);
        return std::optional<time_range>{time_range{lower, std::max(*end + 1, lower + 1)}};
    }

    auto get_spanning_interval(const std::vector<std::int64_t>& event_ids) const
        -> std::expected<std::optional<time_range>, error> {
        if (event_ids.empty()) return std::optional<time_range>{};
        const std::string sql = "SELECT min(time), max(time) FROM events WHERE event_id IN (" + join_ids(event_ids) + ")";
        std::optional<time_range> span;
        auto lock = store_.read_lock();
        log_query("get_spanning_interval", sql);
        auto q = store_.query(sql, {}, [&span](const Row& row) -> std::expected<void, error> {
            if (row.is_null(0) || row.is_null(1)) return {};
            span = time_range{row.get_int64(0), row.get_int64(1) + 1};
            return {};
        });
        if (!q) return core::rewrap(q.error(), "query spanning interval", "timeline.get_spanning_interval");
        return span;
    }

    auto get_event_clusters(const ZoomParams& zoom) const -> std::expected<std::vector<cluster::EventCluster>, error> {
        const auto division = divide_range(zoom.range.widened());
        auto bucketed = bucketed_clusters(zoom, division.period_size);
        if (!bucketed) return std::unexpected(bucketed.error());
        return cluster::merge_clusters(std::move(*bucketed), division.period_size, config_.merge_tolerance_divisor);
    }

    auto get_event_stripes(const ZoomParams& zoom) const -> std::expected<std::vector<cluster::EventStripe>, error> {
        auto clusters = get_event_clusters(zoom);
        if (!clusters) return std::unexpected(clusters.error());
        return cluster::to_stripes(*clusters);
    }

    auto count_all_events() const -> std::expected<std::int64_t, error> {
        const std::string sql = "SELECT count(*) AS count FROM events";
        std::int64_t count = 0;
        auto lock = store_.read_lock();
        log_query("count_all_events", sql);
        auto q = store_.query(sql, {}, [&count](const Row& row) -> std::expected<void, error> {
            count = row.get_int64(0);
            return {};
        });
        if (!q) return core::rewrap(q.error(), "count events", "timeline.count_all_events");
        return count;
    }

    auto get_min_time() const -> std::expected<std::optional<std::int64_t>, error> {
        auto lock = store_.read_lock();
        return scalar_time_locked("min", "timeline.get_min_time");
    }

    auto get_max_time() const -> std::expected<std::optional<std::int64_t>, error> {
        auto lock = store_.read_lock();
        return scalar_time_locked("max", "timeline.get_max_time");
    }

    auto get_data_source_ids() const -> std::expected<std::set<std::int64_t>, error> {
        auto lock = store_.read_lock();
        return data_source_ids_locked();
    }

    auto get_hash_set_names() const -> std::expected<std::map<std::int64_t, std::string>, error> {
        const std::string sql = "SELECT hash_set_id, hash_set_name FROM hash_sets";
        std::map<std::int64_t, std::string> names;
        auto lock = store_.read_lock();
        log_query("get_hash_set_names", sql);
        auto q = store_.query(sql, {}, [&names](const Row& row) -> std::expected<void, error> {
            names.emplace(row.get_int64(0), row.get_text(1));
            return {};
        });
        if (!q) return core::rewrap(q.error(), "query hash set names", "timeline.get_hash_set_names");
        return names;
    }

    auto get_tag_counts_by_tag_name(const std::set<std::int64_t>& event_ids) const
        -> std::expected<std::map<std::string, std::int64_t>, error> {
        std::map<std::string, std::int64_t> counts;
        if (event_ids.empty()) return counts;
        const std::string sql =
            "SELECT tag_name_display_name, count(DISTINCT tag_id) AS count FROM tags WHERE event_id IN (" +
            join_ids(event_ids) + ") GROUP BY tag_name_id, tag_name_display_name";
        auto lock = store_.read_lock();
        log_query("get_tag_counts_by_tag_name", sql);
        auto q = store_.query(sql, {}, [&counts](const Row& row) -> std::expected<void, error> {
            counts[row.get_text(0)] += row.get_int64(1);
            return {};
        });
        if (!q) return core::rewrap(q.error(), "count tags by tag name", "timeline.get_tag_counts_by_tag_name");
        return counts;
    }

    auto get_event_ids_for_artifact(std::int64_t artifact_id) const -> std::expected<std::vector<std::int64_t>, error> {
        const std::string sql = "SELECT event_id FROM events WHERE artifact_id = ? ORDER BY event_id";
        std::vector<std::int64_t> ids;
        auto lock = store_.read_lock();
        log_query("get_event_ids_for_artifact", sql);
        if (auto q = store_.query(sql, {artifact_id}, collect_ids(ids)); !q) {
            return core::rewrap(q.error(), "query events of artifact " + std::to_string(artifact_id),
                                "timeline.get_event_ids_for_artifact");
        }
        return ids;
    }

    auto get_event_ids_for_file(std::int64_t file_id, bool include_derived) const
        -> std::expected<std::vector<std::int64_t>, error> {
        const std::string sql = std::string("SELECT event_id FROM events WHERE file_id = ?") +
                                (include_derived ? "" : " AND artifact_id IS NULL") + " ORDER BY event_id";
        std::vector<std::int64_t> ids;
        auto lock = store_.read_lock();
        log_query("get_event_ids_for_file", sql);
        if (auto q = store_.query(sql, {file_id}, collect_ids(ids)); !q) {
            return core::rewrap(q.error(), "query events of file " + std::to_string(file_id),
                                "timeline.get_event_ids_for_file");
        }
        return ids;
    }

    auto sql_where(const root_filter& filter) const -> std::string {
        return filter_sql::compile(filter, store_.dialect()).sql;
    }

private:
    template <class Fn>
    auto in_transaction(const char* component, Fn&& fn) -> std::expected<void, error> {
        auto tx = store::Transaction::begin(store_);
        if (!tx) return core::rewrap(tx.error(), "begin transaction", component);
        if (auto r = fn(); !r) return r;
        if (auto r = tx->commit(); !r) return core::rewrap(r.error(), "commit", component);
        return {};
    }

    void log_query(const char* operation, const std::string& sql) const {
        if (!config_.log_queries) return;
        sink_.emit(diag::severity::debug, std::string("timeline.") + operation, sql);
    }

    static auto event_from_row(const Row& row) -> std::expected<Event, error> {
        constexpr const char* component = "timeline.get_event_by_id";
        Event ev;
        ev.event_id = row.get_int64(0);
        ev.data_source_id = row.is_null(1) ? 0 : row.get_int64(1);
        ev.file_id = row.get_int64(2);
        ev.artifact_id = row.get_optional_int64(3);
        ev.time = row.get_int64(4);
        if (row.is_null(5) || !is_stored_type(row.get_int64(5))) {
            return integrity_error("event " + std::to_string(ev.event_id) + " has an unknown sub_type", component);
        }
        ev.type = static_cast<event_type_id>(row.get_int64(5));
        ev.full_description = text_or_empty(row, 6);
        ev.med_description = text_or_empty(row, 7);
        ev.short_description = text_or_empty(row, 8);
        const auto known = decode_known(row.is_null(9) ? 0 : row.get_int64(9));
        if (!known) {
            return integrity_error("event " + std::to_string(ev.event_id) + " has an invalid known_state", component);
        }
        ev.known = *known;
        ev.hash_hit = !row.is_null(10) && row.get_int64(10) != 0;
        ev.tagged = !row.is_null(11) && row.get_int64(11) != 0;
        return ev;
    }

    auto insert_hash_hit_locked(std::int64_t event_id, const std::string& name) -> std::expected<void, error> {
        constexpr const char* component = "timeline.insert_event";
        const auto& d = store_.dialect();
        const auto insert_set = d.insert_or_ignore("hash_sets", {"hash_set_name"});
        log_query("insert_event", insert_set);
        if (auto r = store_.execute(insert_set, {name}); !r) {
            return core::rewrap(r.error(), "insert hash set '" + name + "'", component);
        }
        const std::string select_set = "SELECT hash_set_id FROM hash_sets WHERE hash_set_name = ?";
        std::optional<std::int64_t> hash_set_id;
        auto q = store_.query(select_set, {name}, [&hash_set_id](const Row& row) -> std::expected<void, error> {
            hash_set_id = row.get_int64(0);
            return {};
        });
        if (!q) return core::rewrap(q.error(), "look up hash set '" + name + "'", component);
        if (!hash_set_id) return integrity_error("hash set '" + name + "' missing after insert", component);

        const auto insert_hit = d.insert_or_ignore("hash_set_hits", {"hash_set_id", "event_id"});
        log_query("insert_event", insert_hit);
        if (auto r = store_.execute(insert_hit, {*hash_set_id, event_id}); !r) {
            return core::rewrap(r.error(), "insert hash set hit", component);
        }
        return {};
    }

    auto insert_tag_locked(const Tag& tag, std::int64_t event_id) -> std::expected<void, error> {
        const auto sql = store_.dialect().insert_or_ignore(
            "tags", {"tag_id", "tag_name_id", "tag_name_display_name", "event_id"});
        log_query("insert_tag", sql);
        if (auto r = store_.execute(sql, {tag.id, tag.name.id, tag.name.display_name, event_id}); !r) {
            return core::rewrap(r.error(), "insert tag " + std::to_string(tag.id) + " for event " +
                                               std::to_string(event_id),
                                "timeline.insert_tag");
        }
        return {};
    }

    auto add_tag_locked(std::int64_t file_id, std::optional<std::int64_t> artifact_id, const Tag& tag)
        -> std::expected<std::set<std::int64_t>, error> {
        auto tx = store::Transaction::begin(store_);
        if (!tx) return core::rewrap(tx.error(), "begin tag transaction", "timeline.add_tag");
        auto ids = mark_events_tagged_locked(file_id, artifact_id, true);
        if (!ids) return std::unexpected(ids.error());
        for (const auto event_id : *ids) {
            if (auto r = insert_tag_locked(tag, event_id); !r) return std::unexpected(r.error());
        }
        if (auto r = tx->commit(); !r) return core::rewrap(r.error(), "commit tag", "timeline.add_tag");
        return ids;
    }

    /** Set the tagged flag of the file/artifact pair's events; returns their ids. */
    auto mark_events_tagged_locked(std::int64_t file_id, std::optional<std::int64_t> artifact_id, bool tagged)
        -> std::expected<std::set<std::int64_t>, error> {
        constexpr const char* component = "timeline.mark_events_tagged";
        std::string select = "SELECT event_id FROM events WHERE file_id = ?";
        std::vector<sql_value> params{file_id};
        if (artifact_id) {
            select += " AND artifact_id = ?";
            params.emplace_back(*artifact_id);
        } else {
            select += " AND artifact_id IS NULL";
        }
        std::set<std::int64_t> ids;
        log_query("mark_events_tagged", select);
        auto q = store_.query(select, params, [&ids](const Row& row) -> std::expected<void, error> {
            ids.insert(row.get_int64(0));
            return {};
        });
        if (!q) return core::rewrap(q.error(), "select events of file " + std::to_string(file_id), component);
        if (ids.empty()) return ids;

        const std::string update = "UPDATE events SET tagged = ? WHERE event_id IN (" + join_ids(ids) + ")";
        log_query("mark_events_tagged", update);
        if (auto r = store_.execute(update, {std::int64_t{tagged ? 1 : 0}}); !r) {
            return core::rewrap(r.error(), "update tagged flags", component);
        }
        return ids;
    }

    auto scalar_time_locked(const char* aggregate, const char* component) const
        -> std::expected<std::optional<std::int64_t>, error> {
        const std::string sql = std::string("SELECT ") + aggregate + "(time) FROM events";
        std::optional<std::int64_t> value;
        log_query(aggregate, sql);
        auto q = store_.query(sql, {}, [&value](const Row& row) -> std::expected<void, error> {
            value = row.get_optional_int64(0);
            return {};
        });
        if (!q) return core::rewrap(q.error(), std::string("query ") + aggregate + " time", component);
        return value;
    }

    auto data_source_ids_locked() const -> std::expected<std::set<std::int64_t>, error> {
        const std::string sql = "SELECT DISTINCT datasource_id FROM events WHERE datasource_id != 0";
        std::set<std::int64_t> ids;
        log_query("get_data_source_ids", sql);
        auto q = store_.query(sql, {}, [&ids](const Row& row) -> std::expected<void, error> {
            ids.insert(row.get_int64(0));
            return {};
        });
        if (!q) return core::rewrap(q.error(), "query data source ids", "timeline.get_data_source_ids");
        return ids;
    }

    /** Phase 1: one cluster per (time bucket, type, description), spans [min, max + 1). */
    auto bucketed_clusters(const ZoomParams& zoom, time_unit period) const
        -> std::expected<std::vector<cluster::EventCluster>, error> {
        constexpr const char* component = "timeline.get_event_clusters";
        const auto r = zoom.range.widened();
        const auto& d = store_.dialect();
        const auto where = filter_sql::compile(zoom.filter, d);
        const std::string type_col = type_column(zoom.type_zoom);
        const std::string desc_col = description_column(zoom.lod);
        const std::string sql =
            "SELECT " + d.time_bucket("time", period) + " AS bucket, " +
            d.group_concat("events.event_id", kSeparator) + " AS event_ids, " +
            d.group_concat("CASE WHEN hash_hit = 1 THEN events.event_id ELSE NULL END", kSeparator) + " AS hash_hits, " +
            d.group_concat("CASE WHEN tagged = 1 THEN events.event_id ELSE NULL END", kSeparator) + " AS taggeds, " +
            "min(time) AS min_time, max(time) AS max_time, " + type_col + ", " + desc_col +
            " FROM events" + filter_sql::join_clause(where.joins) +
            " WHERE time >= ? AND time < ? AND " + where.sql +
            " GROUP BY bucket, " + type_col + ", " + desc_col + " ORDER BY min(time)";

        std::vector<cluster::EventCluster> clusters;
        auto lock = store_.read_lock();
        log_query("get_event_clusters", sql);
        auto q = store_.query(sql, {r.start, r.end}, [&](const Row& row) -> std::expected<void, error> {
            auto ids = cluster::parse_id_set(text_or_empty(row, 1));
            if (!ids) return std::unexpected(ids.error());
            auto hash_hits = cluster::parse_id_set(text_or_empty(row, 2));
            if (!hash_hits) return std::unexpected(hash_hits.error());
            auto tagged = cluster::parse_id_set(text_or_empty(row, 3));
            if (!tagged) return std::unexpected(tagged.error());
            if (row.is_null(6)) return integrity_error("event with null " + type_col, component);
            const auto type = decode_type(row.get_int64(6), zoom.type_zoom);
            if (!type) return integrity_error("unknown stored " + type_col + " " + row.get_text(6), component);
            const time_range span{row.get_int64(4), row.get_int64(5) + 1};
            clusters.emplace_back(span, *type, text_or_empty(row, 7), zoom.lod, std::move(*ids),
                                  std::move(*hash_hits), std::move(*tagged));
            return {};
        });
        if (!q) return core::rewrap(q.error(), "query bucketed clusters", component);
        return clusters;
    }

    store::HostStore& store_;
    TimelineConfig config_;
    diag::DiagnosticSink& sink_;
};

// Public API forwarding
auto TimelineManager::open(store::HostStore& store, TimelineConfig config, diag::DiagnosticSink* sink)
    -> std::expected<TimelineManager, core::error> {
    if (auto v = validate(config); !v) return std::unexpected(v.error());
    TimelineManager manager(std::make_unique<Impl>(store, config, sink ? *sink : diag::default_sink()));
    if (auto r = manager.initialize_schema(); !r) return std::unexpected(r.error());
    return manager;
}

TimelineManager::TimelineManager(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}
TimelineManager::~TimelineManager() = default;
TimelineManager::TimelineManager(TimelineManager&&) noexcept = default;
TimelineManager& TimelineManager::operator=(TimelineManager&&) noexcept = default;

auto TimelineManager::config() const -> const TimelineConfig& { return impl_->config(); }
auto TimelineManager::initialize_schema() -> std::expected<void, core::error> { return impl_->initialize_schema(); }
auto TimelineManager::reinitialize() -> std::expected<void, core::error> { return impl_->reinitialize(); }
auto TimelineManager::reinitialize_tags() -> std::expected<void, core::error> { return impl_->reinitialize_tags(); }
auto TimelineManager::analyze() -> std::expected<void, core::error> { return impl_->analyze(); }
auto TimelineManager::has_new_columns() const -> std::expected<bool, core::error> { return impl_->has_new_columns(); }
auto TimelineManager::insert_event(const EventInsert& event) -> std::expected<std::int64_t, core::error> { return impl_->insert_event(event); }
auto TimelineManager::add_tag(std::int64_t file_id, std::optional<std::int64_t> artifact_id, const Tag& tag)
    -> std::expected<std::set<std::int64_t>, core::error> { return impl_->add_tag(file_id, artifact_id, tag); }
auto TimelineManager::delete_tag(std::int64_t file_id, std::optional<std::int64_t> artifact_id, std::int64_t tag_id,
                                 bool still_tagged) -> std::expected<std::set<std::int64_t>, core::error> {
    return impl_->delete_tag(file_id, artifact_id, tag_id, still_tagged);
}
auto TimelineManager::get_event_by_id(std::int64_t event_id) const -> std::expected<std::optional<Event>, core::error> { return impl_->get_event_by_id(event_id); }
auto TimelineManager::get_event_ids(const time_range& range, const root_filter& filter) const
    -> std::expected<std::vector<std::int64_t>, core::error> { return impl_->get_event_ids(range, filter); }
auto TimelineManager::count_events_by_type(const ZoomParams& zoom) const
    -> std::expected<std::map<event_type_id, std::int64_t>, core::error> { return impl_->count_events_by_type(zoom); }
auto TimelineManager::get_combined_events(const time_range& range, const root_filter& filter) const
    -> std::expected<std::vector<CombinedEvent>, core::error> { return impl_->get_combined_events(range, filter); }
auto TimelineManager::get_bounding_events_interval(const time_range& range, const root_filter& filter) const
    -> std::expected<std::optional<time_range>, core::error> { return impl_->get_bounding_events_interval(range, filter); }
auto TimelineManager::get_spanning_interval(const std::vector<std::int64_t>& event_ids) const
    -> std::expected<std::optional<time_range>, core::error> { return impl_->get_spanning_interval(event_ids); }
auto TimelineManager::get_event_clusters(const ZoomParams& zoom) const
    -> std::expected<std::vector<cluster::EventCluster>, core::error> { return impl_->get_event_clusters(zoom); }
auto TimelineManager::get_event_stripes(const ZoomParams& zoom) const
    -> std::expected<std::vector<cluster::EventStripe>, core::error> { return impl_->get_event_stripes(zoom); }
auto TimelineManager::count_all_events() const -> std::expected<std::int64_t, core::error> { return impl_->count_all_events(); }
auto TimelineManager::get_min_time() const -> std::expected<std::optional<std::int64_t>, core::error> { return impl_->get_min_time(); }
auto TimelineManager::get_max_time() const -> std::expected<std::optional<std::int64_t>, core::error> { return impl_->get_max_time(); }
auto TimelineManager::get_data_source_ids() const -> std::expected<std::set<std::int64_t>, core::error> { return impl_->get_data_source_ids(); }
auto TimelineManager::get_hash_set_names() const -> std::expected<std::map<std::int64_t, std::string>, core::error> { return impl_->get_hash_set_names(); }
auto TimelineManager::get_tag_counts_by_tag_name(const std::set<std::int64_t>& event_ids) const
    -> std::expected<std::map<std::string, std::int64_t>, core::error> { return impl_->get_tag_counts_by_tag_name(event_ids); }
auto TimelineManager::get_event_ids_for_artifact(std::int64_t artifact_id) const
    -> std::expected<std::vector<std::int64_t>, core::error> { return impl_->get_event_ids_for_artifact(artifact_id); }
auto TimelineManager::get_event_ids_for_file(std::int64_t file_id, bool include_derived) const
    -> std::expected<std::vector<std::int64_t>, core::error> { return impl_->get_event_ids_for_file(file_id, include_derived); }
auto TimelineManager::sql_where(const root_filter& filter) const -> std::string { return impl_->sql_where(filter); }

} // namespace chronicle
